#include <gtest/gtest.h>
#include "vexdoc/vex/validation.hpp"

using namespace vexdoc;
using namespace vexdoc::vex;

namespace {

Statement make_statement(Status status) {
    Statement s;
    s.vulnerability.name = "CVE-2024-1234";
    s.products.push_back(Product{"pkg:oci/app", {}});
    s.status = status;
    return s;
}

std::string failure(const Statement& s) {
    try {
        validate_statement(s);
    } catch (const VexError& e) {
        return e.what();
    }
    return {};
}

} // anonymous namespace

// ---------- Field checks ----------

TEST(VexValidation, Required) {
    EXPECT_NO_THROW(validate_required("product", "x"));
    try {
        validate_required("product", "");
        FAIL() << "expected VexError";
    } catch (const VexError& e) {
        EXPECT_STREQ(e.what(), "product is required");
    }
}

TEST(VexValidation, StringLength) {
    EXPECT_NO_THROW(validate_string_length("author", std::string(MAX_AUTHOR_LENGTH, 'a'), MAX_AUTHOR_LENGTH));
    try {
        validate_string_length("author", std::string(MAX_AUTHOR_LENGTH + 1, 'a'), MAX_AUTHOR_LENGTH);
        FAIL() << "expected VexError";
    } catch (const VexError& e) {
        EXPECT_STREQ(e.what(), "author exceeds maximum length of 200 characters");
    }
}

TEST(VexValidation, DangerousCharacters) {
    EXPECT_NO_THROW(validate_dangerous_chars("product", "pkg:oci/app@sha256:abc?arch=amd64"));
    EXPECT_NO_THROW(validate_dangerous_chars("product", ""));
    for (char c : std::string(";&|`$(){}[]<>'\"\\")) {
        EXPECT_THROW(validate_dangerous_chars("product", std::string("pkg") + c), VexError) << c;
    }
    try {
        validate_dangerous_chars("author", "me; rm -rf /");
        FAIL() << "expected VexError";
    } catch (const VexError& e) {
        EXPECT_STREQ(e.what(), "author contains potentially dangerous characters");
    }
}

TEST(VexValidation, DocumentCount) {
    EXPECT_THROW(validate_document_count(0), VexError);
    EXPECT_THROW(validate_document_count(1), VexError);
    EXPECT_NO_THROW(validate_document_count(2));
    EXPECT_NO_THROW(validate_document_count(20));
    try {
        validate_document_count(21);
        FAIL() << "expected VexError";
    } catch (const VexError& e) {
        EXPECT_STREQ(e.what(), "maximum of 20 documents can be merged at once");
    }
}

// ---------- Status rules ----------

TEST(VexStatementRules, RequiresVulnerabilityAndProduct) {
    auto no_vuln = make_statement(Status::Fixed);
    no_vuln.vulnerability.name.clear();
    EXPECT_EQ(failure(no_vuln), "vulnerability name is required");

    auto no_products = make_statement(Status::Fixed);
    no_products.products.clear();
    EXPECT_EQ(failure(no_products), "at least one product is required");
}

TEST(VexStatementRules, NotAffected) {
    auto s = make_statement(Status::NotAffected);
    EXPECT_EQ(failure(s),
              "either justification or impact statement must be defined when using status \"not_affected\"");

    s.justification = Justification::ComponentNotPresent;
    EXPECT_EQ(failure(s), "");

    auto impact_only = make_statement(Status::NotAffected);
    impact_only.impact_statement = "not reachable";
    EXPECT_EQ(failure(impact_only), "");

    s.action_statement = "upgrade";
    EXPECT_EQ(failure(s), "action statement field is invalid when using status \"not_affected\"");
}

TEST(VexStatementRules, Affected) {
    auto s = make_statement(Status::Affected);
    EXPECT_EQ(failure(s), "action statement must be set when using status \"affected\"");

    s.action_statement = "upgrade to 2.0";
    EXPECT_EQ(failure(s), "");

    s.impact_statement = "reachable";
    EXPECT_EQ(failure(s),
              "justification and impact statement fields are invalid when using status \"affected\"");
}

TEST(VexStatementRules, UnderInvestigation) {
    auto s = make_statement(Status::UnderInvestigation);
    EXPECT_EQ(failure(s), "");

    // Impact statements are allowed while investigating.
    s.impact_statement = "triage in progress";
    EXPECT_EQ(failure(s), "");

    s.justification = Justification::VulnerableCodeNotPresent;
    EXPECT_EQ(failure(s), "justification field is invalid when using status \"under_investigation\"");
}

TEST(VexStatementRules, Fixed) {
    auto s = make_statement(Status::Fixed);
    EXPECT_EQ(failure(s), "");

    auto with_impact = make_statement(Status::Fixed);
    with_impact.impact_statement = "x";
    EXPECT_EQ(failure(with_impact), "impact statement field is invalid when using status \"fixed\"");

    auto with_action = make_statement(Status::Fixed);
    with_action.action_statement = "x";
    EXPECT_EQ(failure(with_action), "action statement field is invalid when using status \"fixed\"");
}
