#pragma once
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace vexdoc {

enum class SessionState {
    Uninitialized,
    Initializing,   // initialize answered, waiting for notifications/initialized
    Ready,
    Closed
};

/// What the peer told us during initialize. Written by the reader thread,
/// read from anywhere.
class Session {
public:
    [[nodiscard]] SessionState state() const;
    void set_state(SessionState s);

    /// Record an initialize request and move to Initializing.
    void begin(const InitializeParams& params, std::string negotiated_version);

    [[nodiscard]] std::optional<Implementation> client_info() const;
    [[nodiscard]] ClientCapabilities client_capabilities() const;
    [[nodiscard]] std::string protocol_version() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::optional<Implementation> client_info_;
    ClientCapabilities client_caps_;
    std::string protocol_version_;
};

std::string to_string(SessionState state);

} // namespace vexdoc
