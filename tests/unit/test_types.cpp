#include <gtest/gtest.h>
#include "vexdoc/types.hpp"
#include <nlohmann/json.hpp>

using namespace vexdoc;

TEST(Types, TextContentSerialize) {
    nlohmann::json j = TextContent{"hello"};
    EXPECT_EQ(j["type"], "text");
    EXPECT_EQ(j["text"], "hello");
}

TEST(Types, TextContentRejectsOtherTypes) {
    nlohmann::json j = {{"type", "image"}, {"data", "..."}};
    EXPECT_THROW(j.get<TextContent>(), std::invalid_argument);
}

TEST(Types, ToolDescriptorUsesCamelCaseSchemaKey) {
    ToolDescriptor d{"echo", "Echo text", {{"type", "object"}}};
    nlohmann::json j = d;
    EXPECT_EQ(j["name"], "echo");
    EXPECT_EQ(j["description"], "Echo text");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_FALSE(j.contains("input_schema"));
    EXPECT_EQ(j.get<ToolDescriptor>(), d);
}

TEST(Types, ToolResultTextOmitsIsError) {
    nlohmann::json j = ToolResult::text("done");
    ASSERT_EQ(j["content"].size(), 1u);
    EXPECT_EQ(j["content"][0]["text"], "done");
    EXPECT_FALSE(j.contains("isError"));
}

TEST(Types, ToolResultErrorSetsIsError) {
    nlohmann::json j = ToolResult::error("Error: bad input");
    EXPECT_EQ(j["isError"], true);
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_EQ(j.get<ToolResult>(), ToolResult::error("Error: bad input"));
}

TEST(Types, EmptyToolResultHasContentArray) {
    nlohmann::json j = ToolResult{};
    EXPECT_TRUE(j["content"].is_array());
    EXPECT_TRUE(j["content"].empty());
}

TEST(Types, InitializeParamsAreLenient) {
    auto p = nlohmann::json::object().get<InitializeParams>();
    EXPECT_TRUE(p.protocol_version.empty());
    EXPECT_FALSE(p.client_info.has_value());

    nlohmann::json full = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"sampling", nlohmann::json::object()}}},
        {"clientInfo", {{"name", "c"}, {"version", "1"}}}
    };
    auto q = full.get<InitializeParams>();
    EXPECT_EQ(q.protocol_version, "2024-11-05");
    EXPECT_TRUE(q.capabilities.sampling.has_value());
    ASSERT_TRUE(q.client_info.has_value());
    EXPECT_EQ(q.client_info->name, "c");
}

TEST(Types, InitializeResultShape) {
    InitializeResult r;
    r.protocol_version = "2024-11-05";
    r.capabilities.tools = nlohmann::json{{"listChanged", false}};
    r.server_info = {"vexdoc-mcp-server", "0.1.0"};

    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2024-11-05");
    EXPECT_EQ(j["capabilities"]["tools"]["listChanged"], false);
    EXPECT_EQ(j["serverInfo"]["name"], "vexdoc-mcp-server");
    EXPECT_EQ(j.get<InitializeResult>(), r);
}
