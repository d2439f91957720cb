#include "vexdoc/vex/document.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace vexdoc::vex {

namespace {

constexpr std::string_view STATUS_NAMES[] = {
    "not_affected", "affected", "fixed", "under_investigation"};

constexpr std::string_view JUSTIFICATION_NAMES[] = {
    "component_not_present",
    "vulnerable_code_not_present",
    "vulnerable_code_not_in_execute_path",
    "vulnerable_code_cannot_be_controlled_by_adversary",
    "inline_mitigations_already_exist"};

// Reads `count` digits at `pos`, advancing it.
int read_digits(std::string_view text, size_t& pos, size_t count) {
    if (pos + count > text.size()) {
        throw VexError("invalid timestamp: " + std::string(text));
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw VexError("invalid timestamp: " + std::string(text));
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return value;
}

void expect_char(std::string_view text, size_t& pos, char expected) {
    if (pos >= text.size() ||
        std::toupper(static_cast<unsigned char>(text[pos])) != expected) {
        throw VexError("invalid timestamp: " + std::string(text));
    }
    ++pos;
}

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw VexError(std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

std::optional<Timestamp> timestamp_field(const nlohmann::json& j, const char* key) {
    auto value = string_field(j, key);
    if (value.empty()) return std::nullopt;
    return parse_timestamp(value);
}

} // anonymous namespace

std::string_view to_string(Status status) {
    return STATUS_NAMES[static_cast<int>(status)];
}

std::string_view to_string(Justification justification) {
    return JUSTIFICATION_NAMES[static_cast<int>(justification)];
}

Status parse_status(std::string_view text) {
    for (size_t i = 0; i < std::size(STATUS_NAMES); ++i) {
        if (STATUS_NAMES[i] == text) return static_cast<Status>(i);
    }
    throw VexError("invalid status: " + std::string(text));
}

Justification parse_justification(std::string_view text) {
    for (size_t i = 0; i < std::size(JUSTIFICATION_NAMES); ++i) {
        if (JUSTIFICATION_NAMES[i] == text) return static_cast<Justification>(i);
    }
    throw VexError("invalid justification: " + std::string(text));
}

// ----------- Timestamps -----------

std::string format_timestamp(Timestamp ts) {
    auto secs = std::chrono::floor<std::chrono::seconds>(ts);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(ts - secs).count();

    std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(secs));
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (nanos > 0) {
        std::ostringstream frac;
        frac << std::setfill('0') << std::setw(9) << nanos;
        std::string digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        oss << '.' << digits;
    }
    oss << 'Z';
    return oss.str();
}

Timestamp parse_timestamp(std::string_view text) {
    size_t pos = 0;
    std::tm tm{};
    tm.tm_year = read_digits(text, pos, 4) - 1900;
    expect_char(text, pos, '-');
    tm.tm_mon = read_digits(text, pos, 2) - 1;
    expect_char(text, pos, '-');
    tm.tm_mday = read_digits(text, pos, 2);
    expect_char(text, pos, 'T');
    tm.tm_hour = read_digits(text, pos, 2);
    expect_char(text, pos, ':');
    tm.tm_min = read_digits(text, pos, 2);
    expect_char(text, pos, ':');
    tm.tm_sec = read_digits(text, pos, 2);

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        throw VexError("invalid timestamp: " + std::string(text));
    }

    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t scale = 100000000;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (scale > 0) {
                nanos += (text[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) throw VexError("invalid timestamp: " + std::string(text));
    }

    int offset_minutes = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int hours = read_digits(text, pos, 2);
        expect_char(text, pos, ':');
        int minutes = read_digits(text, pos, 2);
        offset_minutes = sign * (hours * 60 + minutes);
    } else {
        throw VexError("invalid timestamp: " + std::string(text));
    }
    if (pos != text.size()) {
        throw VexError("invalid timestamp: " + std::string(text));
    }

    std::time_t t = timegm(&tm);
    auto ts = std::chrono::system_clock::from_time_t(t);
    ts -= std::chrono::minutes(offset_minutes);
    ts += std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::nanoseconds(nanos));
    return ts;
}

// ----------- Statement -----------

bool Statement::names_product(const std::string& product_id) const {
    for (const auto& product : products) {
        if (product.id == product_id) return true;
        for (const auto& sub : product.subcomponents) {
            if (sub == product_id) return true;
        }
    }
    return false;
}

// ----------- JSON conversion -----------

void to_json(nlohmann::json& j, const Product& p) {
    j = nlohmann::json{{"@id", p.id}};
    if (!p.subcomponents.empty()) {
        nlohmann::json subs = nlohmann::json::array();
        for (const auto& s : p.subcomponents) subs.push_back(nlohmann::json{{"@id", s}});
        j["subcomponents"] = std::move(subs);
    }
}

void from_json(const nlohmann::json& j, Product& p) {
    // Pre-0.2 documents list products as bare identifiers.
    if (j.is_string()) {
        p.id = j.get<std::string>();
        return;
    }
    if (!j.is_object()) throw VexError("product must be an object");
    p.id = string_field(j, "@id");
    p.subcomponents.clear();
    if (auto it = j.find("subcomponents"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) throw VexError("subcomponents must be an array");
        for (const auto& sub : *it) {
            if (sub.is_string()) {
                p.subcomponents.push_back(sub.get<std::string>());
            } else if (sub.is_object()) {
                p.subcomponents.push_back(string_field(sub, "@id"));
            } else {
                throw VexError("subcomponent must be an object");
            }
        }
    }
}

void to_json(nlohmann::json& j, const Vulnerability& v) {
    j = nlohmann::json{{"name", v.name}};
    if (!v.id.empty()) j["@id"] = v.id;
    if (!v.description.empty()) j["description"] = v.description;
    if (!v.aliases.empty()) j["aliases"] = v.aliases;
}

void from_json(const nlohmann::json& j, Vulnerability& v) {
    if (j.is_string()) {
        v.name = j.get<std::string>();
        return;
    }
    if (!j.is_object()) throw VexError("vulnerability must be an object");
    v.name = string_field(j, "name");
    v.id = string_field(j, "@id");
    v.description = string_field(j, "description");
    v.aliases.clear();
    if (auto it = j.find("aliases"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) throw VexError("aliases must be an array");
        for (const auto& alias : *it) {
            if (!alias.is_string()) throw VexError("aliases must be strings");
            v.aliases.push_back(alias.get<std::string>());
        }
    }
}

void to_json(nlohmann::json& j, const Statement& s) {
    nlohmann::json products = nlohmann::json::array();
    for (const auto& p : s.products) products.push_back(p);

    j = nlohmann::json{
        {"vulnerability", s.vulnerability},
        {"products", std::move(products)},
        {"status", std::string(to_string(s.status))}
    };
    if (s.justification) j["justification"] = std::string(to_string(*s.justification));
    if (!s.impact_statement.empty()) j["impact_statement"] = s.impact_statement;
    if (!s.action_statement.empty()) j["action_statement"] = s.action_statement;
    if (!s.status_notes.empty()) j["status_notes"] = s.status_notes;
    if (s.timestamp) j["timestamp"] = format_timestamp(*s.timestamp);
}

void from_json(const nlohmann::json& j, Statement& s) {
    if (!j.is_object()) throw VexError("statement must be an object");

    if (auto it = j.find("vulnerability"); it != j.end() && !it->is_null()) {
        it->get_to(s.vulnerability);
    }
    s.products.clear();
    if (auto it = j.find("products"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) throw VexError("products must be an array");
        for (const auto& p : *it) s.products.push_back(p.get<Product>());
    }

    auto status = string_field(j, "status");
    if (status.empty()) throw VexError("status is required");
    s.status = parse_status(status);

    auto justification = string_field(j, "justification");
    if (!justification.empty()) {
        s.justification = parse_justification(justification);
    } else {
        s.justification.reset();
    }
    s.impact_statement = string_field(j, "impact_statement");
    s.action_statement = string_field(j, "action_statement");
    s.status_notes = string_field(j, "status_notes");
    s.timestamp = timestamp_field(j, "timestamp");
}

void to_json(nlohmann::json& j, const Document& d) {
    nlohmann::json statements = nlohmann::json::array();
    for (const auto& s : d.statements) statements.push_back(s);

    j = nlohmann::json{
        {"@context", d.context},
        {"@id", d.id},
        {"author", d.author},
        {"version", d.version},
        {"statements", std::move(statements)}
    };
    if (!d.author_role.empty()) j["role"] = d.author_role;
    if (d.timestamp) j["timestamp"] = format_timestamp(*d.timestamp);
    if (d.last_updated) j["last_updated"] = format_timestamp(*d.last_updated);
    if (!d.tooling.empty()) j["tooling"] = d.tooling;
}

void from_json(const nlohmann::json& j, Document& d) {
    if (!j.is_object()) throw VexError("document must be a JSON object");

    d.context = string_field(j, "@context");
    d.id = string_field(j, "@id");
    d.author = string_field(j, "author");
    d.author_role = string_field(j, "role");
    d.timestamp = timestamp_field(j, "timestamp");
    d.last_updated = timestamp_field(j, "last_updated");
    d.tooling = string_field(j, "tooling");

    d.version = 1;
    if (auto it = j.find("version"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) throw VexError("version must be an integer");
        d.version = it->get<int>();
    }

    d.statements.clear();
    if (auto it = j.find("statements"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) throw VexError("statements must be an array");
        size_t index = 0;
        for (const auto& s : *it) {
            ++index;
            try {
                d.statements.push_back(s.get<Statement>());
            } catch (const VexError& e) {
                throw VexError("statement " + std::to_string(index) + ": " + e.what());
            }
        }
    }
}

Document parse_document(const nlohmann::json& j) {
    try {
        return j.get<Document>();
    } catch (const nlohmann::json::exception& e) {
        throw VexError(std::string("malformed document: ") + e.what());
    }
}

} // namespace vexdoc::vex
