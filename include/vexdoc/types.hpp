#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vexdoc {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

// ---------- Tool ----------

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    bool operator==(const ToolDescriptor& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

/// Outcome of a tool run. is_error marks a domain failure, which still
/// travels as a successful response.
struct ToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    static ToolResult text(std::string text);
    static ToolResult error(std::string text);

    bool operator==(const ToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }
};

// ---------- Initialization ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;

    bool operator==(const ServerCapabilities& o) const { return tools == o.tools; }
};

struct ClientCapabilities {
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> sampling;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ClientCapabilities& o) const {
        return roots == o.roots && sampling == o.sampling && experimental == o.experimental;
    }
};

struct InitializeParams {
    std::string protocol_version;
    ClientCapabilities capabilities;
    std::optional<Implementation> client_info;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info;
    }
};

// ---------- JSON conversion ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ToolDescriptor& t);
void from_json(const nlohmann::json& j, ToolDescriptor& t);

void to_json(nlohmann::json& j, const ToolResult& t);
void from_json(const nlohmann::json& j, ToolResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const ClientCapabilities& t);
void from_json(const nlohmann::json& j, ClientCapabilities& t);

void from_json(const nlohmann::json& j, InitializeParams& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace vexdoc
