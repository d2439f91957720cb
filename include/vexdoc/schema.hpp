#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace vexdoc {

/// First constraint a value broke, with a dotted path to the offending node.
struct SchemaViolation {
    std::string path;
    std::string message;

    [[nodiscard]] std::string describe() const { return path + ": " + message; }
};

/// Throws std::invalid_argument unless `schema` is an object schema usable
/// as a tool input schema.
void check_input_schema(const nlohmann::json& schema);

/// Shape-check `value` against a JSON-Schema subset:
/// type, enum, properties, required, additionalProperties, items,
/// minItems/maxItems and minLength/maxLength. Unknown keywords are ignored.
[[nodiscard]] std::optional<SchemaViolation> validate_schema(const nlohmann::json& schema,
                                                             const nlohmann::json& value,
                                                             const std::string& root = "arguments");

} // namespace vexdoc
