#include "vexdoc/session.hpp"

namespace vexdoc {

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::set_state(SessionState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = s;
}

void Session::begin(const InitializeParams& params, std::string negotiated_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_info_ = params.client_info;
    client_caps_ = params.capabilities;
    protocol_version_ = std::move(negotiated_version);
    state_ = SessionState::Initializing;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

ClientCapabilities Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
        case SessionState::Closed:        return "closed";
    }
    return "unknown";
}

} // namespace vexdoc
