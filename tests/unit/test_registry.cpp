#include <gtest/gtest.h>
#include "vexdoc/registry.hpp"
#include "vexdoc/error.hpp"

using namespace vexdoc;

namespace {

std::unique_ptr<ITool> make_tool(const std::string& name, const std::string& description = "d") {
    return std::make_unique<FunctionTool>(
        name, description, nlohmann::json{{"type", "object"}},
        [](const CallContext&, const nlohmann::json&) { return ToolResult::text("ok"); });
}

} // anonymous namespace

TEST(ToolRegistry, ListsInRegistrationOrder) {
    ToolRegistry registry;
    const std::vector<std::string> names = {"zeta", "alpha", "mid", "beta"};
    for (const auto& n : names) registry.add(make_tool(n, "about " + n));

    auto list = registry.list();
    ASSERT_EQ(list.size(), names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        EXPECT_EQ(list[i].name, names[i]);
        EXPECT_EQ(list[i].description, "about " + names[i]);
        EXPECT_EQ(list[i].input_schema, (nlohmann::json{{"type", "object"}}));
    }
}

TEST(ToolRegistry, EmptyListIsEmpty) {
    ToolRegistry registry;
    EXPECT_TRUE(registry.list().empty());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ToolRegistry, DuplicateLeavesRegistryUnchanged) {
    ToolRegistry registry;
    registry.add(make_tool("echo", "first"));
    EXPECT_THROW(registry.add(make_tool("echo", "second")), DuplicateToolError);

    auto list = registry.list();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].description, "first");
}

TEST(ToolRegistry, DuplicateMessageNamesTool) {
    ToolRegistry registry;
    registry.add(make_tool("echo"));
    try {
        registry.add(make_tool("echo"));
        FAIL() << "expected DuplicateToolError";
    } catch (const DuplicateToolError& e) {
        EXPECT_STREQ(e.what(), "Tool already registered: echo");
    }
}

TEST(ToolRegistry, FindReturnsRegisteredTool) {
    ToolRegistry registry;
    registry.add(make_tool("a"));
    ASSERT_NE(registry.find("a"), nullptr);
    EXPECT_EQ(registry.find("a")->name(), "a");
    EXPECT_EQ(registry.find("b"), nullptr);
}

TEST(ToolRegistry, FrozenRejectsAdds) {
    ToolRegistry registry;
    registry.add(make_tool("a"));
    registry.freeze();
    EXPECT_TRUE(registry.frozen());
    EXPECT_THROW(registry.add(make_tool("b")), RegistryFrozenError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistry, FrozenAndDuplicateShareRegistryError) {
    ToolRegistry registry;
    registry.add(make_tool("a"));
    EXPECT_THROW(registry.add(make_tool("a")), RegistryError);
    registry.freeze();
    EXPECT_THROW(registry.add(make_tool("b")), RegistryError);
    // Frozen wins even for a name already taken.
    EXPECT_THROW(registry.add(make_tool("a")), RegistryFrozenError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistry, RejectsInvalidTools) {
    ToolRegistry registry;
    EXPECT_THROW(registry.add(nullptr), std::invalid_argument);
    EXPECT_THROW(registry.add(make_tool("")), std::invalid_argument);

    auto bad_schema = std::make_unique<FunctionTool>(
        "bad", "d", nlohmann::json{{"type", "array"}},
        [](const CallContext&, const nlohmann::json&) { return ToolResult{}; });
    EXPECT_THROW(registry.add(std::move(bad_schema)), std::invalid_argument);
    EXPECT_EQ(registry.size(), 0u);
}
