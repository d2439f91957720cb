#include <benchmark/benchmark.h>
#include "vexdoc/server.hpp"
#include "vexdoc/tools/vex_tools.hpp"
#include "vexdoc/transport/stdio_transport.hpp"
#include <unistd.h>
#include <stdexcept>
#include <thread>

using namespace vexdoc;

// Server and client StdioTransports joined by two pipes. Each transport owns
// the descriptors handed to it.
struct E2EFixture {
    std::unique_ptr<McpServer> server;
    std::unique_ptr<StdioTransport> client;
    std::thread server_thread;
    int64_t next_id = 1;

    explicit E2EFixture(int extra_tools = 0) {
        int c2s[2], s2c[2];
        if (pipe(c2s) != 0 || pipe(s2c) != 0) {
            throw std::runtime_error("pipe() failed");
        }

        McpServer::Options sopts;
        sopts.server_info = {"bench-server", "1.0"};
        sopts.thread_pool_size = 1;
        server = std::make_unique<McpServer>(sopts);
        tools::register_vex_tools(*server, std::make_shared<vex::VexClient>("bench"));
        for (int i = 0; i < extra_tools; ++i) {
            server->register_tool(std::make_unique<FunctionTool>(
                "tool_" + std::to_string(i), "Filler tool", nlohmann::json{{"type", "object"}},
                [](const CallContext&, const nlohmann::json&) { return ToolResult::text("ok"); }));
        }

        auto server_transport = std::make_unique<StdioTransport>(c2s[0], s2c[1]);
        server_thread = std::thread([this, t = std::move(server_transport)]() mutable {
            server->serve(std::move(t));
        });
        client = std::make_unique<StdioTransport>(s2c[0], c2s[1]);
    }

    ~E2EFixture() {
        server->stop();
        if (server_thread.joinable()) server_thread.join();
        client->close();
    }

    // Send one request and wait for its response.
    JsonRpcResponse round_trip(const std::string& method, nlohmann::json params) {
        JsonRpcRequest req;
        req.id = RequestId{next_id++};
        req.method = method;
        req.params = std::move(params);
        client->write(req);

        auto result = client->read();
        auto* msg = std::get_if<JsonRpcMessage>(&result);
        if (!msg || !std::holds_alternative<JsonRpcResponse>(*msg)) {
            throw std::runtime_error("expected a response from " + method);
        }
        return std::get<JsonRpcResponse>(std::move(*msg));
    }
};

static void BM_CreateStatementStdio(benchmark::State& state) {
    E2EFixture fixture;
    const nlohmann::json params = {
        {"name", "create_vex_statement"},
        {"arguments", {
            {"product", "pkg:docker/nginx@1.20.1"},
            {"vulnerability", "CVE-2023-44487"},
            {"status", "fixed"}
        }}
    };
    for (auto _ : state) {
        auto resp = fixture.round_trip("tools/call", params);
        benchmark::DoNotOptimize(resp);
    }
    state.SetLabel("tools/call roundtrip");
}
BENCHMARK(BM_CreateStatementStdio)->MinTime(2.0)->UseRealTime();

static void BM_ListToolsStdio(benchmark::State& state) {
    E2EFixture fixture(97);
    for (auto _ : state) {
        auto resp = fixture.round_trip("tools/list", nlohmann::json::object());
        benchmark::DoNotOptimize(resp);
    }
    state.SetLabel("tools/list roundtrip, 100 tools");
}
BENCHMARK(BM_ListToolsStdio)->MinTime(2.0)->UseRealTime();

static void BM_PingStdio(benchmark::State& state) {
    E2EFixture fixture;
    for (auto _ : state) {
        auto resp = fixture.round_trip("ping", nlohmann::json::object());
        benchmark::DoNotOptimize(resp);
    }
    state.SetLabel("ping roundtrip");
}
BENCHMARK(BM_PingStdio)->MinTime(2.0)->UseRealTime();
