#pragma once
#include "../error.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace vexdoc::vex {

constexpr std::string_view OPENVEX_CONTEXT = "https://openvex.dev/ns/v0.2.0";
/// Any context under this prefix is accepted as OpenVEX.
constexpr std::string_view OPENVEX_CONTEXT_PREFIX = "https://openvex.dev/ns";

using Timestamp = std::chrono::system_clock::time_point;

/// Domain failure raised by the VEX library; tools report it as isError.
class VexError : public VexdocError {
public:
    using VexdocError::VexdocError;
};

// ---------- Enumerations ----------

enum class Status {
    NotAffected,
    Affected,
    Fixed,
    UnderInvestigation
};

enum class Justification {
    ComponentNotPresent,
    VulnerableCodeNotPresent,
    VulnerableCodeNotInExecutePath,
    VulnerableCodeCannotBeControlledByAdversary,
    InlineMitigationsAlreadyExist
};

[[nodiscard]] std::string_view to_string(Status status);
[[nodiscard]] std::string_view to_string(Justification justification);

/// Throws VexError("invalid status: X").
[[nodiscard]] Status parse_status(std::string_view text);
/// Throws VexError("invalid justification: X").
[[nodiscard]] Justification parse_justification(std::string_view text);

// ---------- Timestamps ----------

/// RFC 3339 in UTC, fractional seconds only when non-zero.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

/// Accepts "Z" or a numeric offset and optional fractional seconds.
/// Throws VexError on anything else.
[[nodiscard]] Timestamp parse_timestamp(std::string_view text);

// ---------- Document model ----------

struct Product {
    std::string id;
    std::vector<std::string> subcomponents;

    bool operator==(const Product& o) const {
        return id == o.id && subcomponents == o.subcomponents;
    }
};

struct Vulnerability {
    std::string name;
    std::string id;
    std::string description;
    std::vector<std::string> aliases;

    bool operator==(const Vulnerability& o) const {
        return name == o.name && id == o.id && description == o.description
               && aliases == o.aliases;
    }
};

struct Statement {
    Vulnerability vulnerability;
    std::vector<Product> products;
    Status status = Status::UnderInvestigation;
    std::optional<Justification> justification;
    std::string impact_statement;
    std::string action_statement;
    std::string status_notes;
    std::optional<Timestamp> timestamp;

    /// True when any product, or any of its subcomponents, has this id.
    [[nodiscard]] bool names_product(const std::string& product_id) const;
};

struct Document {
    std::string context{OPENVEX_CONTEXT};
    std::string id;
    std::string author;
    std::string author_role;
    std::optional<Timestamp> timestamp;
    std::optional<Timestamp> last_updated;
    int version = 1;
    std::string tooling;
    std::vector<Statement> statements;
};

// ---------- JSON conversion ----------
// from_json throws VexError for values that are present but wrong.

void to_json(nlohmann::json& j, const Product& p);
void from_json(const nlohmann::json& j, Product& p);

void to_json(nlohmann::json& j, const Vulnerability& v);
void from_json(const nlohmann::json& j, Vulnerability& v);

void to_json(nlohmann::json& j, const Statement& s);
void from_json(const nlohmann::json& j, Statement& s);

void to_json(nlohmann::json& j, const Document& d);
void from_json(const nlohmann::json& j, Document& d);

/// Parse a JSON object as an OpenVEX document. Throws VexError.
[[nodiscard]] Document parse_document(const nlohmann::json& j);

} // namespace vexdoc::vex
