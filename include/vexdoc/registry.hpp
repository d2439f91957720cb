#pragma once
#include "tool.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace vexdoc {

/// Name -> tool map, written during startup and read-only once frozen.
/// Lookups after freeze() take no lock; add() is single-threaded setup.
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Takes ownership. Throws DuplicateToolError or RegistryFrozenError and
    /// leaves the registry untouched; std::invalid_argument for a null tool,
    /// an empty name or an unusable input schema.
    void add(std::unique_ptr<ITool> tool);

    /// nullptr when no tool has that name.
    [[nodiscard]] ITool* find(const std::string& name) const;

    /// Descriptors in registration order.
    [[nodiscard]] std::vector<ToolDescriptor> list() const;

    void freeze() { frozen_ = true; }
    [[nodiscard]] bool frozen() const { return frozen_; }
    [[nodiscard]] size_t size() const { return tools_.size(); }

private:
    std::vector<std::unique_ptr<ITool>> tools_;
    std::unordered_map<std::string, ITool*> index_;
    std::atomic<bool> frozen_{false};
};

} // namespace vexdoc
