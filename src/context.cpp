#include "vexdoc/context.hpp"
#include "vexdoc/error.hpp"

namespace vexdoc {

CallContext::CallContext(RequestId request_id, std::string tool_name,
                         Clock::time_point deadline)
    : request_id_(std::move(request_id)),
      tool_name_(std::move(tool_name)),
      deadline_(deadline) {}

bool CallContext::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_ != CancelReason::None;
}

CancelReason CallContext::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool CallContext::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return reason_ != CancelReason::None; });
}

void CallContext::throw_if_cancelled() const {
    switch (reason()) {
        case CancelReason::None:
            return;
        case CancelReason::Timeout:
            throw TimeoutError("Tool '" + tool_name_ + "' exceeded its deadline");
        case CancelReason::Cancelled:
            throw CancelledError("Call to '" + tool_name_ + "' was cancelled");
        case CancelReason::Shutdown:
            throw CancelledError("Server shutting down");
    }
}

bool CallContext::cancel(CancelReason reason) {
    if (reason == CancelReason::None) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_ != CancelReason::None) return false;
        reason_ = reason;
    }
    cv_.notify_all();
    return true;
}

std::string to_string(CancelReason reason) {
    switch (reason) {
        case CancelReason::None:      return "none";
        case CancelReason::Timeout:   return "timeout";
        case CancelReason::Cancelled: return "cancelled";
        case CancelReason::Shutdown:  return "shutdown";
    }
    return "unknown";
}

} // namespace vexdoc
