#include "vexdoc/vex/client.hpp"
#include "vexdoc/vex/validation.hpp"
#include "vexdoc/version.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <unordered_set>

namespace vexdoc::vex {

namespace {

// Wraps an input check so its message reads "validation error: ...".
template <typename Check>
void checked(Check&& check) {
    try {
        check();
    } catch (const VexError& e) {
        throw VexError(std::string("validation error: ") + e.what());
    }
}

std::string merged_id(const std::vector<Document>& docs) {
    // 64-bit FNV-1a over the source ids, newline separated.
    uint64_t hash = 14695981039346656037ULL;
    for (const auto& doc : docs) {
        for (unsigned char c : doc.id) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        hash ^= static_cast<unsigned char>('\n');
        hash *= 1099511628211ULL;
    }
    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(hash));
    return "merged-vex-" + std::string(hex);
}

} // anonymous namespace

VexClient::VexClient(std::string default_author, WallClock clock)
    : default_author_(std::move(default_author)), clock_(std::move(clock)) {
    if (default_author_.empty()) default_author_ = std::string(SERVER_NAME);
    if (!clock_) clock_ = [] { return std::chrono::system_clock::now(); };
}

// ---------------------------------------------------------------------------
// create_statement
// ---------------------------------------------------------------------------
Document VexClient::create_statement(const CreateOptions& opts) const {
    checked([&] {
        validate_required("product", opts.product);
        validate_string_length("product", opts.product, MAX_STRING_LENGTH);
        validate_dangerous_chars("product", opts.product);

        validate_required("vulnerability", opts.vulnerability);
        validate_string_length("vulnerability", opts.vulnerability, MAX_STRING_LENGTH);

        validate_required("status", opts.status);

        validate_string_length("justification", opts.justification, MAX_STRING_LENGTH);
        validate_string_length("impact_statement", opts.impact_statement, MAX_STRING_LENGTH);
        validate_dangerous_chars("impact_statement", opts.impact_statement);
        validate_string_length("action_statement", opts.action_statement, MAX_STRING_LENGTH);
        validate_dangerous_chars("action_statement", opts.action_statement);
        validate_string_length("author", opts.author, MAX_AUTHOR_LENGTH);
        validate_dangerous_chars("author", opts.author);
    });

    Statement statement;
    statement.vulnerability.name = opts.vulnerability;
    statement.products.push_back(Product{opts.product, {}});
    statement.status = parse_status(opts.status);
    if (!opts.justification.empty()) {
        statement.justification = parse_justification(opts.justification);
    }
    statement.impact_statement = opts.impact_statement;
    statement.action_statement = opts.action_statement;

    try {
        validate_statement(statement);
    } catch (const VexError& e) {
        throw VexError(std::string("statement validation failed: ") + e.what());
    }

    const auto created = now();
    const auto unix_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        created.time_since_epoch()).count();

    Document doc;
    doc.id = "vex-" + std::to_string(unix_seconds);
    doc.author = opts.author.empty() ? default_author_ : opts.author;
    doc.version = 1;
    doc.timestamp = created;
    doc.statements.push_back(std::move(statement));
    return doc;
}

// ---------------------------------------------------------------------------
// merge_documents
// ---------------------------------------------------------------------------
Document VexClient::merge_documents(const MergeOptions& opts) const {
    checked([&] {
        validate_document_count(opts.documents.size());
        validate_string_length("author", opts.author, MAX_AUTHOR_LENGTH);
        validate_dangerous_chars("author", opts.author);
        validate_string_length("author_role", opts.author_role, MAX_AUTHOR_LENGTH);
        validate_dangerous_chars("author_role", opts.author_role);
        validate_string_length("id", opts.id, MAX_ID_LENGTH);
        validate_dangerous_chars("id", opts.id);

        for (size_t i = 0; i < opts.products.size(); ++i) {
            const std::string name = "products[" + std::to_string(i) + "]";
            validate_string_length(name, opts.products[i], MAX_STRING_LENGTH);
            validate_dangerous_chars(name, opts.products[i]);
        }
        for (size_t i = 0; i < opts.vulnerabilities.size(); ++i) {
            validate_string_length("vulnerabilities[" + std::to_string(i) + "]",
                                   opts.vulnerabilities[i], MAX_STRING_LENGTH);
        }
    });

    for (size_t i = 0; i < opts.documents.size(); ++i) {
        const auto& raw = opts.documents[i];
        const std::string label = "document " + std::to_string(i + 1);
        if (!raw.is_object() || !raw.contains("@context")) {
            throw VexError(label + " must be a valid VEX document with @context");
        }
        if (!raw.contains("statements")) {
            throw VexError(label + " must be a valid VEX document with statements");
        }
    }

    std::vector<Document> sources;
    sources.reserve(opts.documents.size());
    for (size_t i = 0; i < opts.documents.size(); ++i) {
        try {
            sources.push_back(parse_document(opts.documents[i]));
        } catch (const VexError& e) {
            throw VexError("failed to parse document " + std::to_string(i + 1) + ": " + e.what());
        }
    }

    std::vector<Statement> statements;
    for (const auto& doc : sources) {
        for (auto statement : doc.statements) {
            if (!statement.timestamp) statement.timestamp = doc.timestamp;
            statements.push_back(std::move(statement));
        }
    }
    std::stable_sort(statements.begin(), statements.end(),
                     [](const Statement& a, const Statement& b) {
                         return a.timestamp < b.timestamp;
                     });

    if (!opts.products.empty()) {
        std::vector<Statement> kept;
        for (auto& statement : statements) {
            bool match = std::any_of(opts.products.begin(), opts.products.end(),
                                     [&](const std::string& p) { return statement.names_product(p); });
            if (match) kept.push_back(std::move(statement));
        }
        statements = std::move(kept);
    }

    if (!opts.vulnerabilities.empty()) {
        std::unordered_set<std::string> wanted(opts.vulnerabilities.begin(), opts.vulnerabilities.end());
        statements.erase(std::remove_if(statements.begin(), statements.end(),
                                        [&](const Statement& s) {
                                            return wanted.count(s.vulnerability.name) == 0;
                                        }),
                         statements.end());
    }

    Document merged;
    merged.id = opts.id.empty() ? merged_id(sources) : opts.id;
    merged.author = opts.author.empty() ? default_author_ : opts.author;
    merged.author_role = opts.author_role;
    merged.version = 1;
    merged.timestamp = now();
    merged.statements = std::move(statements);
    return merged;
}

// ---------------------------------------------------------------------------
// validate_document
// ---------------------------------------------------------------------------
Document VexClient::validate_document(const nlohmann::json& raw) const {
    if (!raw.is_object()) {
        throw VexError("document must be a JSON object");
    }
    auto context = raw.find("@context");
    if (context == raw.end()) {
        throw VexError("document must contain @context");
    }
    if (!context->is_string() ||
        context->get<std::string>().rfind(OPENVEX_CONTEXT_PREFIX, 0) != 0) {
        throw VexError("unsupported @context: " + context->dump());
    }
    auto statements = raw.find("statements");
    if (statements == raw.end() || !statements->is_array()) {
        throw VexError("document must contain a statements array");
    }

    Document doc = parse_document(raw);
    for (size_t i = 0; i < doc.statements.size(); ++i) {
        try {
            validate_statement(doc.statements[i]);
        } catch (const VexError& e) {
            throw VexError("statement " + std::to_string(i + 1) + ": " + e.what());
        }
    }
    return doc;
}

} // namespace vexdoc::vex
