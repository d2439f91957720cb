#pragma once
#include "json_rpc.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace vexdoc {

class VexdocError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised by the codec. Carries the JSON-RPC code to answer with and the
/// request id when it could be recovered from the broken message.
class ParseError : public VexdocError {
public:
    int code;
    std::optional<RequestId> id;
    ParseError(int code, const std::string& msg, std::optional<RequestId> id = std::nullopt)
        : VexdocError(msg), code(code), id(std::move(id)) {}
};

class ProtocolError : public VexdocError {
public:
    int code;
    std::optional<nlohmann::json> data;
    ProtocolError(int code, const std::string& msg,
                  std::optional<nlohmann::json> data = std::nullopt)
        : VexdocError(msg), code(code), data(std::move(data)) {}
};

class TransportError : public VexdocError {
public:
    using VexdocError::VexdocError;
};

class TimeoutError : public VexdocError {
public:
    using VexdocError::VexdocError;
};

class CancelledError : public VexdocError {
public:
    using VexdocError::VexdocError;
};

class RegistryError : public VexdocError {
public:
    using VexdocError::VexdocError;
};

class DuplicateToolError : public RegistryError {
public:
    explicit DuplicateToolError(const std::string& name)
        : RegistryError("Tool already registered: " + name) {}
};

class RegistryFrozenError : public RegistryError {
public:
    explicit RegistryFrozenError(const std::string& name)
        : RegistryError("Registry is frozen, cannot register tool: " + name) {}
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace vexdoc
