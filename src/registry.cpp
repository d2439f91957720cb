#include "vexdoc/registry.hpp"
#include "vexdoc/error.hpp"
#include "vexdoc/schema.hpp"
#include <stdexcept>

namespace vexdoc {

void ToolRegistry::add(std::unique_ptr<ITool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register a null tool");
    }
    std::string name = tool->name();
    if (name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (frozen_) {
        throw RegistryFrozenError(name);
    }
    if (index_.count(name) > 0) {
        throw DuplicateToolError(name);
    }
    check_input_schema(tool->input_schema());

    index_.emplace(name, tool.get());
    tools_.push_back(std::move(tool));
}

ITool* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

std::vector<ToolDescriptor> ToolRegistry::list() const {
    std::vector<ToolDescriptor> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back(tool->descriptor());
    }
    return out;
}

} // namespace vexdoc
