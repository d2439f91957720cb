#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace vexdoc {

enum class CancelReason {
    None,
    Timeout,      // per-call deadline passed
    Cancelled,    // peer sent notifications/cancelled
    Shutdown      // dispatcher is stopping
};

/// Cancellation-bearing context handed to every tool run.
/// The dispatcher owns cancellation; tools only observe it.
class CallContext {
public:
    using Clock = std::chrono::steady_clock;

    CallContext(RequestId request_id, std::string tool_name,
                Clock::time_point deadline = Clock::time_point::max());

    CallContext(const CallContext&) = delete;
    CallContext& operator=(const CallContext&) = delete;

    [[nodiscard]] const RequestId& request_id() const { return request_id_; }
    [[nodiscard]] const std::string& tool_name() const { return tool_name_; }
    [[nodiscard]] Clock::time_point deadline() const { return deadline_; }

    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] CancelReason reason() const;

    /// Block for up to `timeout` or until cancelled. Returns cancelled().
    bool wait_for(std::chrono::milliseconds timeout) const;

    /// Throws TimeoutError or CancelledError once cancelled.
    void throw_if_cancelled() const;

    /// Returns true only for the call that moved the context out of None.
    bool cancel(CancelReason reason);

private:
    RequestId request_id_;
    std::string tool_name_;
    Clock::time_point deadline_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    CancelReason reason_{CancelReason::None};
};

std::string to_string(CancelReason reason);

} // namespace vexdoc
