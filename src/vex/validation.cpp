#include "vexdoc/vex/validation.hpp"

#include <string_view>

namespace vexdoc::vex {

namespace {

constexpr std::string_view DANGEROUS_CHARS = ";&|`$(){}[]<>'\"\\";

std::string quoted(Status status) {
    return "\"" + std::string(to_string(status)) + "\"";
}

} // anonymous namespace

void validate_required(const std::string& name, const std::string& value) {
    if (value.empty()) {
        throw VexError(name + " is required");
    }
}

void validate_string_length(const std::string& name, const std::string& value, size_t max_length) {
    if (value.size() > max_length) {
        throw VexError(name + " exceeds maximum length of " + std::to_string(max_length) + " characters");
    }
}

void validate_dangerous_chars(const std::string& name, const std::string& value) {
    if (value.find_first_of(DANGEROUS_CHARS) != std::string::npos) {
        throw VexError(name + " contains potentially dangerous characters");
    }
}

void validate_document_count(size_t count) {
    if (count < MIN_MERGE_DOCUMENTS) {
        throw VexError("at least " + std::to_string(MIN_MERGE_DOCUMENTS) +
                       " VEX documents are required for merging");
    }
    if (count > MAX_MERGE_DOCUMENTS) {
        throw VexError("maximum of " + std::to_string(MAX_MERGE_DOCUMENTS) +
                       " documents can be merged at once");
    }
}

void validate_statement(const Statement& s) {
    if (s.vulnerability.name.empty()) {
        throw VexError("vulnerability name is required");
    }
    if (s.products.empty()) {
        throw VexError("at least one product is required");
    }

    const bool has_justification = s.justification.has_value();
    const bool has_impact = !s.impact_statement.empty();
    const bool has_action = !s.action_statement.empty();

    switch (s.status) {
        case Status::NotAffected:
            if (!has_justification && !has_impact) {
                throw VexError("either justification or impact statement must be defined when using status " +
                               quoted(s.status));
            }
            if (has_action) {
                throw VexError("action statement field is invalid when using status " + quoted(s.status));
            }
            break;
        case Status::Affected:
            if (has_justification || has_impact) {
                throw VexError("justification and impact statement fields are invalid when using status " +
                               quoted(s.status));
            }
            if (!has_action) {
                throw VexError("action statement must be set when using status " + quoted(s.status));
            }
            break;
        case Status::UnderInvestigation:
            if (has_justification) {
                throw VexError("justification field is invalid when using status " + quoted(s.status));
            }
            if (has_action) {
                throw VexError("action statement field is invalid when using status " + quoted(s.status));
            }
            break;
        case Status::Fixed:
            if (has_justification) {
                throw VexError("justification field is invalid when using status " + quoted(s.status));
            }
            if (has_impact) {
                throw VexError("impact statement field is invalid when using status " + quoted(s.status));
            }
            if (has_action) {
                throw VexError("action statement field is invalid when using status " + quoted(s.status));
            }
            break;
    }
}

} // namespace vexdoc::vex
