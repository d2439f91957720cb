#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace vexdoc {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
///
/// Framing: one message per line, '\n' terminated; a trailing '\r' is
/// dropped and blank lines are skipped. A final line without '\n' before EOF
/// still counts. Lines over max_message_bytes are reported as decode failures.
///
/// Writes block while the peer is not reading. After interrupt(), a write
/// that makes no progress for stalled_write_timeout fails with TransportError.
class StdioTransport : public ITransport {
public:
    static constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 1024 * 1024;
    static constexpr std::chrono::milliseconds DEFAULT_STALLED_WRITE_TIMEOUT{2000};

    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// Takes ownership of both descriptors.
    StdioTransport(int read_fd, int write_fd,
                   size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES,
                   std::chrono::milliseconds stalled_write_timeout = DEFAULT_STALLED_WRITE_TIMEOUT);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ReadResult read() override;
    void write(const JsonRpcMessage& msg) override;
    void interrupt() override;
    void close() override;
    bool is_open() const override;

private:
    void open_wakeup_pipe();
    ReadResult decode_line(std::string line);
    bool wait_writable();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    size_t max_message_bytes_;
    std::chrono::milliseconds stalled_write_timeout_;

    std::string buffer_;
    bool eof_{false};
    bool discarding_{false};   // skipping the tail of an oversized line

    std::atomic<bool> interrupted_{false};
    std::atomic<bool> closed_{false};

    std::mutex write_mutex_;
    std::mutex close_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for waking up a blocked read
};

} // namespace vexdoc
