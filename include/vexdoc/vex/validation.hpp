#pragma once
#include "document.hpp"
#include <cstddef>
#include <string>

namespace vexdoc::vex {

// Input bounds
constexpr size_t MAX_STRING_LENGTH   = 1000;
constexpr size_t MAX_AUTHOR_LENGTH   = 200;
constexpr size_t MAX_ID_LENGTH       = 500;
constexpr size_t MIN_MERGE_DOCUMENTS = 2;
constexpr size_t MAX_MERGE_DOCUMENTS = 20;

// Each check throws VexError with a message naming the field.
// Empty values pass every check but validate_required.

void validate_required(const std::string& name, const std::string& value);
void validate_string_length(const std::string& name, const std::string& value, size_t max_length);

/// Rejects shell and markup metacharacters: ; & | ` $ ( ) { } [ ] < > ' " \ .
void validate_dangerous_chars(const std::string& name, const std::string& value);

void validate_document_count(size_t count);

/// OpenVEX status rules plus a vulnerability name and at least one product.
void validate_statement(const Statement& statement);

} // namespace vexdoc::vex
