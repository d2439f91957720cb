#include <benchmark/benchmark.h>
#include "vexdoc/codec.hpp"
#include "vexdoc/json_rpc.hpp"
#include <string>

using namespace vexdoc;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kCreateCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"create_vex_statement",)"
    R"("arguments":{"product":"pkg:npm/lodash@4.17.21","vulnerability":"CVE-2021-23337",)"
    R"("status":"not_affected","justification":"vulnerable_code_not_in_execute_path"}}})";

// A merge call carrying N single-statement documents
static std::string make_merge_call(int n) {
    nlohmann::json documents = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        documents.push_back({
            {"@context", "https://openvex.dev/ns/v0.2.0"},
            {"@id", "https://vendor.example/vex/" + std::to_string(i)},
            {"author", "vendor"},
            {"timestamp", "2024-01-01T00:00:00Z"},
            {"statements", nlohmann::json::array({{
                {"vulnerability", {{"name", "CVE-2024-" + std::to_string(1000 + i)}}},
                {"products", nlohmann::json::array({{{"@id", "pkg:apk/wolfi/git@2.39.0-r1"}}})},
                {"status", "under_investigation"}
            }})}
        });
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"method", "tools/call"},
        {"params", {{"name", "merge_vex_documents"}, {"arguments", {{"documents", documents}}}}}
    };
    return req.dump();
}

static const std::string kLargeMerge = make_merge_call(100);

// ---- Parse ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseCreateCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kCreateCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kCreateCall.size());
}
BENCHMARK(BM_ParseCreateCall)->MinTime(1.0);

static void BM_ParseLargeMerge(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeMerge);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeMerge.size());
}
BENCHMARK(BM_ParseLargeMerge)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.code);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize ----

static void BM_SerializeResult(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, nlohmann::json
        {{"content", nlohmann::json::array({{{"type", "text"}, {"text", "VEX document is valid: 1 statement(s)"}}})}});
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeResult)->MinTime(1.0);

static void BM_SerializeLargeMerge(benchmark::State& state) {
    auto msg = Codec::parse(kLargeMerge);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeMerge.size());
}
BENCHMARK(BM_SerializeLargeMerge)->MinTime(1.0);
