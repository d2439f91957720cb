#include "vexdoc/tools/vex_tools.hpp"
#include "vexdoc/log.hpp"
#include "vexdoc/server.hpp"

namespace vexdoc::tools {

VexCreateTool::VexCreateTool(std::shared_ptr<const vex::VexClient> client)
    : client_(std::move(client)) {}

std::string VexCreateTool::name() const {
    return "create_vex_statement";
}

std::string VexCreateTool::description() const {
    return "Generate VEX (Vulnerability Exploitability eXchange) statements to document security "
           "vulnerability assessments for software products. Creates OpenVEX-compliant JSON documents "
           "that specify whether products are affected by specific vulnerabilities.";
}

nlohmann::json VexCreateTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"product", {
                {"type", "string"},
                {"description", "Software product identifier using PURL (Package URL) format, e.g., "
                                "pkg:npm/lodash@4.17.21, pkg:docker/nginx@1.20.1, "
                                "pkg:apk/wolfi/git@2.39.0-r1?arch=x86_64"}
            }},
            {"vulnerability", {
                {"type", "string"},
                {"description", "Security vulnerability identifier from CVE, GHSA, or other vulnerability "
                                "databases (e.g., CVE-2023-1234, GHSA-xxxx-xxxx-xxxx)"}
            }},
            {"status", {
                {"type", "string"},
                {"description", "Assessment of how the vulnerability affects this product: not_affected "
                                "(product is safe), affected (vulnerable), fixed (patched), "
                                "under_investigation (being analyzed)"},
                {"enum", {"not_affected", "affected", "fixed", "under_investigation"}}
            }},
            {"justification", {
                {"type", "string"},
                {"description", "Technical reason why a product is not affected by the vulnerability "
                                "(required when status=not_affected unless impact_statement is given)"},
                {"enum", {"component_not_present", "vulnerable_code_not_present",
                          "vulnerable_code_not_in_execute_path",
                          "vulnerable_code_cannot_be_controlled_by_adversary",
                          "inline_mitigations_already_exist"}}
            }},
            {"impact_statement", {
                {"type", "string"},
                {"description", "Detailed technical explanation of why the vulnerability cannot be "
                                "exploited in this product context (used with status=not_affected)"}
            }},
            {"action_statement", {
                {"type", "string"},
                {"description", "Recommended remediation actions for affected products, such as version "
                                "upgrades, configuration changes, or workarounds (used with status=affected)"}
            }},
            {"author", {
                {"type", "string"},
                {"description", "Security analyst, team, or organization responsible for this "
                                "vulnerability assessment"}
            }}
        }},
        {"required", {"product", "vulnerability", "status"}}
    };
}

ToolResult VexCreateTool::execute(const CallContext& ctx, const nlohmann::json& arguments) {
    ctx.throw_if_cancelled();

    vex::CreateOptions opts;
    opts.product = arguments.value("product", "");
    opts.vulnerability = arguments.value("vulnerability", "");
    opts.status = arguments.value("status", "");
    opts.justification = arguments.value("justification", "");
    opts.impact_statement = arguments.value("impact_statement", "");
    opts.action_statement = arguments.value("action_statement", "");
    opts.author = arguments.value("author", "");

    try {
        vex::Document doc = client_->create_statement(opts);
        nlohmann::json j = doc;
        return ToolResult::text("VEX statement created successfully:\n\n" + j.dump(2));
    } catch (const vex::VexError& e) {
        log_info("vex", std::string("create_vex_statement rejected: ") + e.what());
        return ToolResult::error(std::string("Error: ") + e.what());
    }
}

// ---------------------------------------------------------------------------

void register_vex_tools(McpServer& server, std::shared_ptr<const vex::VexClient> client) {
    server.register_tool(std::make_unique<VexCreateTool>(client));
    server.register_tool(std::make_unique<VexMergeTool>(client));
    server.register_tool(std::make_unique<VexValidateTool>(std::move(client)));
}

} // namespace vexdoc::tools
