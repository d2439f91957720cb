#include <benchmark/benchmark.h>
#include "vexdoc/router.hpp"
#include "vexdoc/schema.hpp"
#include "vexdoc/tools/vex_tools.hpp"
#include "vexdoc/vex/client.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace vexdoc;

// Router with N extra methods next to ping (unique_ptr: Router holds a mutex)
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    return router;
}

static JsonRpcRequest make_request(int64_t id, const std::string& method) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = method;
    return req;
}

// ---- Router ----

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcMessage msg = make_request(1, "ping");
    for (auto _ : state) {
        auto resp = router->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcMessage msg = make_request(1, "resources/list");
    for (auto _ : state) {
        auto resp = router->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto router = make_router(100);
    std::vector<JsonRpcMessage> requests;
    for (int i = 0; i < 100; ++i) {
        requests.emplace_back(make_request(i, "method_" + std::to_string(i)));
    }

    size_t i = 0;
    for (auto _ : state) {
        auto resp = router->dispatch(requests[i % requests.size()]);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    Router router;
    router.on_notification("notifications/initialized", [](const nlohmann::json&) {});
    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    JsonRpcMessage msg = notif;
    for (auto _ : state) {
        auto resp = router.dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);

// ---- Argument validation ----

static void BM_ValidateCreateArguments(benchmark::State& state) {
    tools::VexCreateTool tool(std::make_shared<vex::VexClient>("bench"));
    const auto schema = tool.input_schema();
    const nlohmann::json args = {
        {"product", "pkg:npm/lodash@4.17.21"},
        {"vulnerability", "CVE-2021-23337"},
        {"status", "not_affected"},
        {"justification", "vulnerable_code_not_in_execute_path"}
    };
    for (auto _ : state) {
        auto violation = validate_schema(schema, args);
        benchmark::DoNotOptimize(violation);
    }
}
BENCHMARK(BM_ValidateCreateArguments)->MinTime(1.0);

// ---- Domain operations ----

static void BM_CreateStatement(benchmark::State& state) {
    vex::VexClient client("bench");
    vex::CreateOptions opts;
    opts.product = "pkg:docker/nginx@1.20.1";
    opts.vulnerability = "CVE-2023-44487";
    opts.status = "affected";
    opts.action_statement = "Upgrade to nginx 1.25.3";
    for (auto _ : state) {
        auto doc = client.create_statement(opts);
        benchmark::DoNotOptimize(doc);
    }
}
BENCHMARK(BM_CreateStatement)->MinTime(1.0);

static void BM_MergeDocuments(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    vex::VexClient client("bench");
    vex::MergeOptions opts;
    for (int i = 0; i < n; ++i) {
        opts.documents.push_back({
            {"@context", "https://openvex.dev/ns/v0.2.0"},
            {"@id", "doc-" + std::to_string(i)},
            {"author", "vendor"},
            {"timestamp", "2024-01-0" + std::to_string(1 + i % 9) + "T00:00:00Z"},
            {"statements", nlohmann::json::array({{
                {"vulnerability", {{"name", "CVE-2024-" + std::to_string(1000 + i)}}},
                {"products", nlohmann::json::array({{{"@id", "pkg:npm/app@1.0.0"}}})},
                {"status", "fixed"}
            }})}
        });
    }
    for (auto _ : state) {
        auto doc = client.merge_documents(opts);
        benchmark::DoNotOptimize(doc);
    }
}
BENCHMARK(BM_MergeDocuments)->Arg(2)->Arg(20)->MinTime(1.0);
