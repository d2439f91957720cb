#pragma once
#include "../tool.hpp"
#include "../vex/client.hpp"
#include <memory>
#include <string>

namespace vexdoc {

class McpServer;

namespace tools {

/// create_vex_statement: one product, one vulnerability, one status.
class VexCreateTool : public ITool {
public:
    explicit VexCreateTool(std::shared_ptr<const vex::VexClient> client);

    std::string name() const override;
    std::string description() const override;
    nlohmann::json input_schema() const override;
    ToolResult execute(const CallContext& ctx, const nlohmann::json& arguments) override;

private:
    std::shared_ptr<const vex::VexClient> client_;
};

/// merge_vex_documents: combine 2..20 documents, optionally filtered.
class VexMergeTool : public ITool {
public:
    explicit VexMergeTool(std::shared_ptr<const vex::VexClient> client);

    std::string name() const override;
    std::string description() const override;
    nlohmann::json input_schema() const override;
    ToolResult execute(const CallContext& ctx, const nlohmann::json& arguments) override;

private:
    std::shared_ptr<const vex::VexClient> client_;
};

/// validate_vex_document: check one document against the OpenVEX rules.
class VexValidateTool : public ITool {
public:
    explicit VexValidateTool(std::shared_ptr<const vex::VexClient> client);

    std::string name() const override;
    std::string description() const override;
    nlohmann::json input_schema() const override;
    ToolResult execute(const CallContext& ctx, const nlohmann::json& arguments) override;

private:
    std::shared_ptr<const vex::VexClient> client_;
};

/// Register all three tools, sharing one client.
void register_vex_tools(McpServer& server, std::shared_ptr<const vex::VexClient> client);

} // namespace tools
} // namespace vexdoc
