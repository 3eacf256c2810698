#include <benchmark/benchmark.h>
#include "mcpkit/codec.hpp"
#include "mcpkit/json_rpc.hpp"
#include <string>

using namespace mcpkit;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"bash","arguments":{"command":"ls -la","timeout":30}},"_meta":{"progressToken":"job-42"}})";

// tools/call request whose arguments carry `n` nested entries
static std::string make_large_request(int n) {
    nlohmann::json args = nlohmann::json::object();
    for (int i = 0; i < n; ++i) {
        args["key_" + std::to_string(i)] = {
            {"value", i}, {"label", "entry number " + std::to_string(i)}, {"tags", {"a", "b"}}
        };
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
        {"params", {{"name", "bulk"}, {"arguments", args}}}
    };
    return req.dump();
}

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kPing);
        benchmark::DoNotOptimize(req);
    }
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kToolCall);
        benchmark::DoNotOptimize(req);
    }
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_ParseLargeRequest(benchmark::State& state) {
    const auto raw = make_large_request(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto req = Codec::parse_request(raw);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * raw.size()));
}
BENCHMARK(BM_ParseLargeRequest)->Arg(10)->Arg(100)->Arg(1000)->MinTime(1.0);

static void BM_ParseInvalid(benchmark::State& state) {
    const std::string raw = R"({"jsonrpc":"2.0","id":1,"method":)";
    for (auto _ : state) {
        try {
            auto req = Codec::parse_request(raw);
            benchmark::DoNotOptimize(req);
        } catch (const McpParseError&) {
            benchmark::ClobberMemory();
        }
    }
}
BENCHMARK(BM_ParseInvalid)->MinTime(1.0);

static void BM_SerializeV1Error(benchmark::State& state) {
    auto resp = Response::v1_error(1, {error::MethodNotFound, "Method not found: x", std::nullopt});
    for (auto _ : state) {
        auto line = Codec::serialize(resp);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_SerializeV1Error)->MinTime(1.0);

static void BM_SerializeProgress(benchmark::State& state) {
    ServerNotification n = ProgressNotification{std::string("job-42"), 0.5,
                                                std::string("halfway"), uint64_t{100}};
    for (auto _ : state) {
        auto line = Codec::serialize(n);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_SerializeProgress)->MinTime(1.0);
