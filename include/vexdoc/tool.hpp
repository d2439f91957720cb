#pragma once
#include "context.hpp"
#include "types.hpp"
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace vexdoc {

/// A named, schema-described unit of work.
///
/// execute() returns a ToolResult for every outcome the tool understands,
/// including domain failures (ToolResult::error). Throwing is reserved for
/// faults; the dispatcher answers those with an InternalError.
/// Implementations must be safe to call from several threads at once.
class ITool {
public:
    virtual ~ITool() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::string description() const = 0;
    [[nodiscard]] virtual nlohmann::json input_schema() const = 0;

    virtual ToolResult execute(const CallContext& ctx, const nlohmann::json& arguments) = 0;

    [[nodiscard]] ToolDescriptor descriptor() const {
        return ToolDescriptor{name(), description(), input_schema()};
    }
};

using ToolFunction = std::function<ToolResult(const CallContext& ctx,
                                              const nlohmann::json& arguments)>;

/// Adapts a callable into an ITool.
class FunctionTool : public ITool {
public:
    FunctionTool(std::string name, std::string description,
                 nlohmann::json input_schema, ToolFunction fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn)) {}

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }
    nlohmann::json input_schema() const override { return input_schema_; }

    ToolResult execute(const CallContext& ctx, const nlohmann::json& arguments) override {
        return fn_(ctx, arguments);
    }

private:
    std::string name_;
    std::string description_;
    nlohmann::json input_schema_;
    ToolFunction fn_;
};

} // namespace vexdoc
