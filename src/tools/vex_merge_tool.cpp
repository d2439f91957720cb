#include "vexdoc/tools/vex_tools.hpp"
#include "vexdoc/log.hpp"

namespace vexdoc::tools {

namespace {

std::vector<std::string> string_list(const nlohmann::json& arguments, const char* key) {
    std::vector<std::string> out;
    auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

nlohmann::json string_array_schema(const std::string& description, const std::string& item_description) {
    return {
        {"type", "array"},
        {"description", description},
        {"items", {{"type", "string"}, {"description", item_description}}}
    };
}

} // anonymous namespace

VexMergeTool::VexMergeTool(std::shared_ptr<const vex::VexClient> client)
    : client_(std::move(client)) {}

std::string VexMergeTool::name() const {
    return "merge_vex_documents";
}

std::string VexMergeTool::description() const {
    return "Merge and consolidate multiple VEX documents into a unified security assessment report. "
           "This tool can merge vulnerability statements from different sources, teams, or vendors into "
           "a single authoritative VEX document. Supports filtering by products or vulnerabilities.";
}

nlohmann::json VexMergeTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"documents", {
                {"type", "array"},
                {"description", "Collection of VEX documents to merge from different sources (vendors, "
                                "teams, previous assessments). Each must be a complete OpenVEX-formatted "
                                "document."},
                {"items", {
                    {"type", "object"},
                    {"description", "Complete OpenVEX document with @context and a statements array"}
                }}
            }},
            {"author", {
                {"type", "string"},
                {"description", "Security analyst, team, or organization responsible for the merged "
                                "assessment"}
            }},
            {"author_role", {
                {"type", "string"},
                {"description", "Role or title of the person creating the merged document"}
            }},
            {"id", {
                {"type", "string"},
                {"description", "Custom identifier for the merged document. Generated when omitted."}
            }},
            {"products", string_array_schema(
                "Only keep statements for these products",
                "Product identifier in PURL format")},
            {"vulnerabilities", string_array_schema(
                "Only keep statements for these vulnerabilities",
                "Security vulnerability identifier from CVE, GHSA, or other vulnerability databases")}
        }},
        {"required", nlohmann::json::array({"documents"})}
    };
}

ToolResult VexMergeTool::execute(const CallContext& ctx, const nlohmann::json& arguments) {
    ctx.throw_if_cancelled();

    vex::MergeOptions opts;
    if (auto it = arguments.find("documents"); it != arguments.end() && it->is_array()) {
        opts.documents.assign(it->begin(), it->end());
    }
    opts.author = arguments.value("author", "");
    opts.author_role = arguments.value("author_role", "");
    opts.id = arguments.value("id", "");
    opts.products = string_list(arguments, "products");
    opts.vulnerabilities = string_list(arguments, "vulnerabilities");

    try {
        vex::Document doc = client_->merge_documents(opts);
        nlohmann::json j = doc;
        log_debug("vex", "merged " + std::to_string(opts.documents.size()) + " documents into " +
                         std::to_string(doc.statements.size()) + " statement(s)");
        return ToolResult::text("VEX documents merged successfully:\n\n" + j.dump(2));
    } catch (const vex::VexError& e) {
        log_info("vex", std::string("merge_vex_documents rejected: ") + e.what());
        return ToolResult::error(std::string("Error: ") + e.what());
    }
}

} // namespace vexdoc::tools
