#include "vexdoc/transport/stdio_transport.hpp"
#include "vexdoc/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <climits>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

namespace vexdoc {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false),
      max_message_bytes_(DEFAULT_MAX_MESSAGE_BYTES),
      stalled_write_timeout_(DEFAULT_STALLED_WRITE_TIMEOUT) {
    open_wakeup_pipe();
}

StdioTransport::StdioTransport(int read_fd, int write_fd, size_t max_message_bytes,
                               std::chrono::milliseconds stalled_write_timeout)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true),
      max_message_bytes_(max_message_bytes),
      stalled_write_timeout_(stalled_write_timeout) {
    open_wakeup_pipe();
}

StdioTransport::~StdioTransport() {
    close();
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::open_wakeup_pipe() {
    if (pipe(wakeup_pipe_) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

ReadResult StdioTransport::decode_line(std::string line) {
    try {
        return Codec::parse(line);
    } catch (const ParseError& e) {
        return DecodeFailure{e.code, e.what(), e.id};
    }
}

ReadResult StdioTransport::read() {
    char chunk[4096];

    while (true) {
        if (interrupted_ || closed_) return EndOfStream{};

        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);

            if (discarding_) {
                discarding_ = false;
                continue;
            }
            // Remove trailing \r if present (CRLF)
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.size() > max_message_bytes_) {
                return DecodeFailure{error::ParseError,
                    "Message exceeds " + std::to_string(max_message_bytes_) + " bytes",
                    std::nullopt};
            }
            if (is_blank(line)) continue;
            return decode_line(std::move(line));
        }

        if (discarding_) {
            buffer_.clear();
        } else if (buffer_.size() > max_message_bytes_) {
            buffer_.clear();
            discarding_ = true;
            return DecodeFailure{error::ParseError,
                "Message exceeds " + std::to_string(max_message_bytes_) + " bytes",
                std::nullopt};
        }

        if (eof_) {
            if (discarding_ || is_blank(buffer_)) {
                buffer_.clear();
                return EndOfStream{};
            }
            std::string line = std::move(buffer_);
            buffer_.clear();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return decode_line(std::move(line));
        }

        // poll() so that interrupt() can break a blocking read via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + strerror(errno));
        }

        if (fds[1].revents & POLLIN) continue;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(std::string("Read error: ") + strerror(errno));
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void StdioTransport::write(const JsonRpcMessage& msg) {
    std::string data = Codec::serialize(msg);
    data += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        throw TransportError("Transport closed");
    }
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        if (!wait_writable()) {
            throw TransportError("Write stalled: peer stopped reading during shutdown");
        }
        // At most PIPE_BUF per call, so a writable pipe never blocks us.
        size_t chunk = std::min(remaining, static_cast<size_t>(PIPE_BUF));
        ssize_t written = ::write(write_fd_, p, chunk);
        if (written < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(std::string("Write error: ") + strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

// False once interrupted and the peer has not drained for stalled_write_timeout_.
bool StdioTransport::wait_writable() {
    while (true) {
        const bool interrupted = interrupted_;
        struct pollfd fds[2];
        fds[0].fd = write_fd_;
        fds[0].events = POLLOUT;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = interrupted
            ? ::poll(fds, 1, static_cast<int>(stalled_write_timeout_.count()))
            : ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + strerror(errno));
        }
        if (ret == 0) return false;
        // Errors and hangups surface from the write itself.
        if (fds[0].revents & (POLLOUT | POLLERR | POLLHUP | POLLNVAL)) return true;
    }
}

void StdioTransport::interrupt() {
    if (interrupted_.exchange(true)) return;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        // A full pipe already holds a pending wakeup.
        (void)::write(wakeup_pipe_[1], &b, 1);
    }
}

void StdioTransport::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_.exchange(true)) return;
    interrupt();

    std::lock_guard<std::mutex> write_lock(write_mutex_);
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
        read_fd_ = -1;
        write_fd_ = -1;
    }
}

bool StdioTransport::is_open() const {
    return !closed_;
}

} // namespace vexdoc
