#include "vexdoc/schema.hpp"
#include <cmath>
#include <stdexcept>

namespace vexdoc {

namespace {

std::string type_name(const nlohmann::json& v) {
    if (v.is_number_integer()) return "integer";
    if (v.is_number()) return "number";
    return v.type_name();
}

bool matches_type(const std::string& type, const nlohmann::json& v) {
    if (type == "object")  return v.is_object();
    if (type == "array")   return v.is_array();
    if (type == "string")  return v.is_string();
    if (type == "boolean") return v.is_boolean();
    if (type == "null")    return v.is_null();
    if (type == "number")  return v.is_number();
    if (type == "integer") {
        if (v.is_number_integer()) return true;
        if (v.is_number_float()) {
            double d = v.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    return true;
}

// Non-negative integer keyword such as minItems, if present.
std::optional<size_t> size_bound(const nlohmann::json& schema, const char* key) {
    auto it = schema.find(key);
    if (it == schema.end() || !it->is_number_integer()) return std::nullopt;
    auto n = it->get<int64_t>();
    if (n < 0) return std::nullopt;
    return static_cast<size_t>(n);
}

std::optional<SchemaViolation> check_type(const nlohmann::json& schema,
                                          const nlohmann::json& value,
                                          const std::string& path) {
    auto it = schema.find("type");
    if (it == schema.end()) return std::nullopt;

    if (it->is_string()) {
        auto type = it->get<std::string>();
        if (!matches_type(type, value)) {
            return SchemaViolation{path, "expected type '" + type + "', got '" + type_name(value) + "'"};
        }
    } else if (it->is_array()) {
        std::string names;
        for (const auto& t : *it) {
            if (!t.is_string()) continue;
            if (matches_type(t.get<std::string>(), value)) return std::nullopt;
            if (!names.empty()) names += "|";
            names += t.get<std::string>();
        }
        return SchemaViolation{path, "expected type '" + names + "', got '" + type_name(value) + "'"};
    }
    return std::nullopt;
}

std::optional<SchemaViolation> validate_node(const nlohmann::json& schema,
                                             const nlohmann::json& value,
                                             const std::string& path) {
    if (!schema.is_object()) return std::nullopt;

    if (auto v = check_type(schema, value, path)) return v;

    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        bool found = false;
        for (const auto& allowed : *it) {
            if (allowed == value) { found = true; break; }
        }
        if (!found) {
            return SchemaViolation{path, "value " + value.dump() + " is not one of " + it->dump()};
        }
    }

    if (value.is_object()) {
        if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
            for (const auto& name : *it) {
                if (name.is_string() && !value.contains(name.get<std::string>())) {
                    return SchemaViolation{path, "missing required property '" + name.get<std::string>() + "'"};
                }
            }
        }

        const nlohmann::json* properties = nullptr;
        if (auto it = schema.find("properties"); it != schema.end() && it->is_object()) {
            properties = &*it;
        }
        const nlohmann::json* additional = nullptr;
        if (auto it = schema.find("additionalProperties"); it != schema.end()) {
            additional = &*it;
        }

        for (const auto& [key, member] : value.items()) {
            const std::string member_path = path + "." + key;
            if (properties && properties->contains(key)) {
                if (auto v = validate_node(properties->at(key), member, member_path)) return v;
                continue;
            }
            if (!additional) continue;
            if (additional->is_boolean() && !additional->get<bool>()) {
                return SchemaViolation{path, "unexpected property '" + key + "'"};
            }
            if (additional->is_object()) {
                if (auto v = validate_node(*additional, member, member_path)) return v;
            }
        }
    }

    if (value.is_array()) {
        if (auto min = size_bound(schema, "minItems"); min && value.size() < *min) {
            return SchemaViolation{path, "expected at least " + std::to_string(*min) + " items"};
        }
        if (auto max = size_bound(schema, "maxItems"); max && value.size() > *max) {
            return SchemaViolation{path, "expected at most " + std::to_string(*max) + " items"};
        }
        if (auto it = schema.find("items"); it != schema.end() && it->is_object()) {
            for (size_t i = 0; i < value.size(); ++i) {
                if (auto v = validate_node(*it, value[i], path + "[" + std::to_string(i) + "]")) return v;
            }
        }
    }

    if (value.is_string()) {
        // Lengths count bytes, matching the document library's limits.
        const auto len = value.get_ref<const std::string&>().size();
        if (auto min = size_bound(schema, "minLength"); min && len < *min) {
            return SchemaViolation{path, "shorter than " + std::to_string(*min) + " characters"};
        }
        if (auto max = size_bound(schema, "maxLength"); max && len > *max) {
            return SchemaViolation{path, "longer than " + std::to_string(*max) + " characters"};
        }
    }

    return std::nullopt;
}

} // anonymous namespace

void check_input_schema(const nlohmann::json& schema) {
    if (!schema.is_object()) {
        throw std::invalid_argument("Input schema must be a JSON object");
    }
    auto type = schema.find("type");
    if (type == schema.end() || !type->is_string() || type->get<std::string>() != "object") {
        throw std::invalid_argument("Input schema must declare \"type\": \"object\"");
    }
    if (auto props = schema.find("properties"); props != schema.end() && !props->is_object()) {
        throw std::invalid_argument("Input schema 'properties' must be an object");
    }
    if (auto req = schema.find("required"); req != schema.end()) {
        if (!req->is_array()) {
            throw std::invalid_argument("Input schema 'required' must be an array");
        }
        for (const auto& name : *req) {
            if (!name.is_string()) {
                throw std::invalid_argument("Input schema 'required' entries must be strings");
            }
        }
    }
}

std::optional<SchemaViolation> validate_schema(const nlohmann::json& schema,
                                               const nlohmann::json& value,
                                               const std::string& root) {
    return validate_node(schema, value, root);
}

} // namespace vexdoc
