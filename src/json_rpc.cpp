#include "vexdoc/json_rpc.hpp"
#include "vexdoc/version.hpp"

namespace vexdoc {

std::string request_id_key(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) {
        return "i:" + std::to_string(*i);
    }
    return "s:" + std::get<std::string>(id);
}

std::string to_string(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) {
        return std::to_string(*i);
    }
    return "\"" + std::get<std::string>(id) + "\"";
}

JsonRpcResponse JsonRpcResponse::success(RequestId id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse JsonRpcResponse::failure(RequestId id, JsonRpcError error) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = std::move(error);
    return resp;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    // An error wins if both were set by hand; the wire never carries both.
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    n.method = j.at("method").get<std::string>();
    if (j.contains("params")) n.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace vexdoc
