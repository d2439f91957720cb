#include <gtest/gtest.h>
#include "vexdoc/server.hpp"
#include "../support/stdio_peer.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace vexdoc;
using vexdoc::test::StdioPeer;

namespace {

using namespace std::chrono_literals;

// Blocks until cancelled, then reports the reason it saw.
class BlockingTool : public ITool {
public:
    std::string name() const override { return "block"; }
    std::string description() const override { return "Waits until cancelled"; }
    nlohmann::json input_schema() const override { return {{"type", "object"}}; }

    ToolResult execute(const CallContext& ctx, const nlohmann::json&) override {
        ++started;
        ctx.wait_for(10s);
        last_reason = ctx.reason();
        ctx.throw_if_cancelled();
        return ToolResult::text("finished");
    }

    std::atomic<int> started{0};
    std::atomic<CancelReason> last_reason{CancelReason::None};
};

nlohmann::json call_block(int id) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
            {"params", {{"name", "block"}, {"arguments", nlohmann::json::object()}}}};
}

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // anonymous namespace

TEST(CancellationTest, CancelNotificationAnswersCall) {
    StdioPeer peer;
    McpServer server;
    auto tool = std::make_unique<BlockingTool>();
    BlockingTool* block = tool.get();
    server.register_tool(std::move(tool));

    std::thread server_thread([&server, t = peer.server_transport()]() mutable {
        server.serve(std::move(t));
    });

    peer.send(call_block(1));
    ASSERT_TRUE(wait_until([block] { return block->started.load() == 1; }));

    peer.send({{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
               {"params", {{"requestId", 1}, {"reason", "user aborted"}}}});

    auto reply = peer.read_json();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 1);
    EXPECT_EQ((*reply)["error"]["code"], -32603);
    EXPECT_EQ((*reply)["error"]["message"], "Request cancelled");
    EXPECT_EQ((*reply)["error"]["data"]["reason"], "user aborted");
    EXPECT_TRUE(wait_until([block] { return block->last_reason.load() == CancelReason::Cancelled; }));

    // The tool's late failure produces no second response.
    peer.send({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}});
    auto pong = peer.read_json();
    ASSERT_TRUE(pong.has_value());
    EXPECT_EQ((*pong)["id"], 2);

    peer.close_input();
    server_thread.join();
}

TEST(CancellationTest, CancelUnknownRequestIsIgnored) {
    StdioPeer peer;
    McpServer server;
    std::thread server_thread([&server, t = peer.server_transport()]() mutable {
        server.serve(std::move(t));
    });

    peer.send({{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
               {"params", {{"requestId", 999}, {"reason", "test cancel"}}}});
    peer.send({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}});

    auto reply = peer.read_json();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 1);

    peer.close_input();
    server_thread.join();
}

TEST(CancellationTest, TimeoutAnswersCall) {
    StdioPeer peer;
    McpServer::Options opts;
    opts.call_timeout = 100ms;
    McpServer server(opts);
    auto tool = std::make_unique<BlockingTool>();
    BlockingTool* block = tool.get();
    server.register_tool(std::move(tool));

    std::thread server_thread([&server, t = peer.server_transport()]() mutable {
        server.serve(std::move(t));
    });

    auto start = std::chrono::steady_clock::now();
    peer.send(call_block(1));
    auto reply = peer.read_json();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["error"]["message"], "Tool execution timed out");
    EXPECT_EQ((*reply)["error"]["data"]["timeoutMs"], 100);
    EXPECT_GE(elapsed, 90ms);
    EXPECT_LT(elapsed, 5s);
    EXPECT_TRUE(wait_until([block] { return block->last_reason.load() == CancelReason::Timeout; }));

    peer.close_input();
    server_thread.join();
}

TEST(CancellationTest, ShutdownCancelsRunningCalls) {
    StdioPeer peer;
    McpServer::Options opts;
    opts.call_timeout = 0ms;
    opts.drain_timeout = 100ms;
    McpServer server(opts);
    auto tool = std::make_unique<BlockingTool>();
    BlockingTool* block = tool.get();
    server.register_tool(std::move(tool));

    std::thread server_thread([&server, t = peer.server_transport()]() mutable {
        server.serve(std::move(t));
    });

    peer.send(call_block(1));
    ASSERT_TRUE(wait_until([block] { return block->started.load() == 1; }));
    server.stop();

    auto reply = peer.read_json();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 1);
    EXPECT_EQ((*reply)["error"]["message"], "Server shutting down");

    server_thread.join();
    EXPECT_EQ(block->last_reason.load(), CancelReason::Shutdown);
    EXPECT_TRUE(peer.output_closed());
}
