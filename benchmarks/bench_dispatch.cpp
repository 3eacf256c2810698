#include <benchmark/benchmark.h>
#include "mcpkit/server.hpp"
#include "mcpkit/version.hpp"
#include <memory>
#include <string>

using namespace mcpkit;

namespace {

// Does no work of its own so the numbers reflect dispatcher overhead.
class NullCapability : public Capability {
public:
    InitializeResult initialize(const ServerCapabilities& declared) override {
        InitializeResult r;
        r.protocol_version = std::string(PROTOCOL_VERSION);
        r.server_info = {"bench", std::string(LIBRARY_VERSION), std::nullopt};
        r.capabilities = declared;
        return r;
    }
    Page<Tool> list_tools(const std::optional<std::string>&) override {
        Page<Tool> page;
        for (int i = 0; i < 20; ++i) {
            Tool t;
            t.name = "tool_" + std::to_string(i);
            page.items.push_back(std::move(t));
        }
        return page;
    }
    CallToolResult call_tool(const std::string& name, const nlohmann::json&,
                             const ProgressSender&) override {
        CallToolResult r;
        r.content.push_back(TextContent{name});
        return r;
    }
    Page<Resource> list_resources(const std::optional<std::string>&) override { return {}; }
    ReadResourceResult read_resource(const std::string&) override { return {}; }
    Page<ResourceTemplate> list_resource_templates(const std::optional<std::string>&) override {
        return {};
    }
    void subscribe(const std::string&) override {}
    void unsubscribe(const std::string&) override {}
    Page<Prompt> list_prompts(const std::optional<std::string>&) override { return {}; }
    GetPromptResult get_prompt(const std::string&, const nlohmann::json&) override { return {}; }
    void set_log_level(const std::string&) override {}
    CompletionResult complete(const nlohmann::json&) override { return {}; }
    void on_request_cancelled(const std::string&, const std::optional<std::string>&) override {}
};

Request make_request(const std::string& method, std::optional<nlohmann::json> params = std::nullopt) {
    Request req;
    req.jsonrpc = "2.0";
    req.id = 1;
    req.method = method;
    req.params = std::move(params);
    return req;
}

} // namespace

static void BM_DispatchPing(benchmark::State& state) {
    Server server(std::make_shared<NullCapability>(), Server::Options{});
    auto req = make_request("ping");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPing)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    Server server(std::make_shared<NullCapability>(), Server::Options{});
    auto req = make_request("not/a/method");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    Server server(std::make_shared<NullCapability>(), Server::Options{});
    auto req = make_request("tools/list");
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->MinTime(1.0);

// Includes registry bookkeeping and one thread hand-off per call.
static void BM_DispatchToolsCall(benchmark::State& state) {
    Server server(std::make_shared<NullCapability>(), Server::Options{});
    auto req = make_request("tools/call", nlohmann::json{{"name", "noop"}});
    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsCall)->MinTime(1.0);

static void BM_HandleLine(benchmark::State& state) {
    Server server(std::make_shared<NullCapability>(), Server::Options{});
    const std::string line = R"({"jsonrpc":"2.0","id":7,"method":"ping"})";
    for (auto _ : state) {
        auto out = server.handle_line(line);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleLine)->MinTime(1.0);
