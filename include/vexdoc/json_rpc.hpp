#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace vexdoc {

using RequestId = std::variant<int64_t, std::string>;

// Helper to convert RequestId to json
inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

/// Throws std::invalid_argument for anything but a string or an integer that
/// fits in int64_t.
inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()) {
        auto value = j.get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::invalid_argument("RequestId out of range");
        }
        id = static_cast<int64_t>(value);
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

/// Stable map key for an id; keeps 1 and "1" apart.
std::string request_id_key(const RequestId& id);

/// Human-readable form for log lines.
std::string to_string(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result/error is set when built through success()/failure().
struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    static JsonRpcResponse success(RequestId id, nlohmann::json result);
    static JsonRpcResponse failure(RequestId id, JsonRpcError error);

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void from_json(const nlohmann::json& j, JsonRpcNotification& n);

void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace vexdoc
