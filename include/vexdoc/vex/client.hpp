#pragma once
#include "document.hpp"
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vexdoc::vex {

struct CreateOptions {
    std::string product;
    std::string vulnerability;
    std::string status;
    std::string justification;
    std::string impact_statement;
    std::string action_statement;
    std::string author;
};

struct MergeOptions {
    std::vector<nlohmann::json> documents;
    std::string author;
    std::string author_role;
    std::string id;
    std::vector<std::string> products;         // keep only statements naming one of these
    std::vector<std::string> vulnerabilities;  // keep only statements about one of these
};

/// Builds, merges and checks OpenVEX documents. Stateless apart from its
/// configuration, so one instance can serve concurrent tool calls.
class VexClient {
public:
    using WallClock = std::function<Timestamp()>;

    /// An empty author falls back to "vexdoc-mcp-server"; an empty clock to
    /// the system clock.
    explicit VexClient(std::string default_author = {}, WallClock clock = {});

    /// A one-statement document. Input problems are reported as
    /// "validation error: ..."; enumeration and status-rule failures as is.
    [[nodiscard]] Document create_statement(const CreateOptions& opts) const;

    /// Concatenate the statements of 2..20 documents, ordered by timestamp.
    [[nodiscard]] Document merge_documents(const MergeOptions& opts) const;

    /// Parse and check a document, returning it on success. Throws VexError
    /// describing the first problem found.
    [[nodiscard]] Document validate_document(const nlohmann::json& doc) const;

    [[nodiscard]] const std::string& default_author() const { return default_author_; }

private:
    [[nodiscard]] Timestamp now() const { return clock_(); }

    std::string default_author_;
    WallClock clock_;
};

} // namespace vexdoc::vex
