#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace vexdoc {

class Codec {
public:
    /// Parse one framed message into an envelope.
    /// Throws ParseError carrying the JSON-RPC code (-32700 for bad JSON,
    /// -32600 for a bad envelope) and the request id when one was readable.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace vexdoc
