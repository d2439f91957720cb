#include "vexdoc/tools/vex_tools.hpp"
#include "vexdoc/log.hpp"

namespace vexdoc::tools {

VexValidateTool::VexValidateTool(std::shared_ptr<const vex::VexClient> client)
    : client_(std::move(client)) {}

std::string VexValidateTool::name() const {
    return "validate_vex_document";
}

std::string VexValidateTool::description() const {
    return "Check an OpenVEX document for structural problems and status rule violations before "
           "publishing or merging it.";
}

nlohmann::json VexValidateTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"document", {
                {"type", "object"},
                {"description", "Complete OpenVEX document to check"}
            }}
        }},
        {"required", nlohmann::json::array({"document"})}
    };
}

ToolResult VexValidateTool::execute(const CallContext& ctx, const nlohmann::json& arguments) {
    ctx.throw_if_cancelled();

    try {
        vex::Document doc = client_->validate_document(arguments.at("document"));
        return ToolResult::text("VEX document is valid: " + std::to_string(doc.statements.size()) +
                                " statement(s)");
    } catch (const vex::VexError& e) {
        log_debug("vex", std::string("validate_vex_document: ") + e.what());
        return ToolResult::error(std::string("Error: ") + e.what());
    }
}

} // namespace vexdoc::tools
