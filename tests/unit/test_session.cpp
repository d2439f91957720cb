#include <gtest/gtest.h>
#include "vexdoc/session.hpp"

using namespace vexdoc;

TEST(Session, InitialState) {
    Session s;
    EXPECT_EQ(s.state(), SessionState::Uninitialized);
    EXPECT_FALSE(s.client_info().has_value());
    EXPECT_TRUE(s.protocol_version().empty());
}

TEST(Session, BeginRecordsClient) {
    Session s;
    InitializeParams params;
    params.protocol_version = "2025-06-18";
    params.client_info = Implementation{"inspector", "0.9"};
    params.capabilities.roots = nlohmann::json{{"listChanged", true}};

    s.begin(params, "2024-11-05");
    EXPECT_EQ(s.state(), SessionState::Initializing);
    ASSERT_TRUE(s.client_info().has_value());
    EXPECT_EQ(s.client_info()->name, "inspector");
    EXPECT_EQ(s.protocol_version(), "2024-11-05");
    EXPECT_TRUE(s.client_capabilities().roots.has_value());
}

TEST(Session, StateTransitions) {
    Session s;
    s.set_state(SessionState::Ready);
    EXPECT_EQ(s.state(), SessionState::Ready);
    s.set_state(SessionState::Closed);
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, ToString) {
    EXPECT_EQ(to_string(SessionState::Uninitialized), "uninitialized");
    EXPECT_EQ(to_string(SessionState::Ready), "ready");
}
