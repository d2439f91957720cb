#pragma once
#include "../json_rpc.hpp"
#include <optional>
#include <string>
#include <variant>

namespace vexdoc {

/// The peer closed the channel, or the transport was interrupted.
struct EndOfStream {};

/// An inbound frame that did not decode into an envelope.
/// `id` is set when the request id could still be read from it.
struct DecodeFailure {
    int code;
    std::string message;
    std::optional<RequestId> id;
};

using ReadResult = std::variant<JsonRpcMessage, EndOfStream, DecodeFailure>;

/// Abstract bidirectional message channel.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Block until the next inbound frame is available.
    virtual ReadResult read() = 0;

    /// Deliver one outbound message. Throws TransportError on failure.
    /// Safe to call from any thread, but callers serialize writes.
    virtual void write(const JsonRpcMessage& msg) = 0;

    /// Make a pending and every later read() return EndOfStream.
    /// Writes keep working so in-flight calls can still be answered, but a
    /// write that can make no progress fails with TransportError in bounded time.
    virtual void interrupt() = 0;

    /// Release resources. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

} // namespace vexdoc
