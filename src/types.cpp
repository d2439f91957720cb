#include "vexdoc/types.hpp"
#include <stdexcept>

namespace vexdoc {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    auto type = j.value("type", std::string("text"));
    if (type != "text") {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- ToolDescriptor ----------

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void from_json(const nlohmann::json& j, ToolDescriptor& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.at("inputSchema");
    t.description = j.value("description", std::string());
}

// ---------- ToolResult ----------

ToolResult ToolResult::text(std::string text) {
    ToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    return result;
}

ToolResult ToolResult::error(std::string text) {
    ToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    result.is_error = true;
    return result;
}

void to_json(nlohmann::json& j, const ToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        j["content"].push_back(c);
    }
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, ToolResult& t) {
    t.content.clear();
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            t.content.push_back(cj.get<TextContent>());
        }
    }
    t.is_error = j.value("isError", false);
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
}

void to_json(nlohmann::json& j, const ClientCapabilities& t) {
    j = nlohmann::json::object();
    if (t.roots) j["roots"] = *t.roots;
    if (t.sampling) j["sampling"] = *t.sampling;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ClientCapabilities& t) {
    if (j.contains("roots")) t.roots = j.at("roots");
    if (j.contains("sampling")) t.sampling = j.at("sampling");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

// ---------- Initialization ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.value("version", std::string());
}

// Clients in the wild send partial initialize params; every field is optional.
void from_json(const nlohmann::json& j, InitializeParams& t) {
    t.protocol_version = j.value("protocolVersion", std::string());
    if (j.contains("capabilities") && j.at("capabilities").is_object()) {
        t.capabilities = j.at("capabilities").get<ClientCapabilities>();
    }
    if (j.contains("clientInfo") && !j.at("clientInfo").is_null()) {
        t.client_info = j.at("clientInfo").get<Implementation>();
    }
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
}

} // namespace vexdoc
