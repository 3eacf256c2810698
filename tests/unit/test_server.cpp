#include <gtest/gtest.h>
#include "mcpkit/server.hpp"
#include "mcpkit/codec.hpp"
#include "mocks/mock_capability.hpp"
#include <future>

using namespace mcpkit;
using mcpkit::test::MockCapability;

namespace {

Request make_request(nlohmann::json id, std::string method,
                     std::optional<nlohmann::json> params = std::nullopt,
                     std::optional<std::string> version = std::string("2.0")) {
    Request r;
    r.jsonrpc = std::move(version);
    r.id = std::move(id);
    r.method = std::move(method);
    r.params = std::move(params);
    return r;
}

Request make_notification(std::string method, nlohmann::json params) {
    Request r;
    r.jsonrpc = "2.0";
    r.method = std::move(method);
    r.params = std::move(params);
    return r;
}

std::unique_ptr<Server> make_server(std::shared_ptr<MockCapability> cap) {
    return ServerBuilder()
        .with_resources(true)
        .with_prompts()
        .with_completions()
        .with_logging()
        .with_thread_pool_size(2)
        .build(std::move(cap));
}

} // namespace

class ServerTest : public ::testing::Test {
protected:
    std::shared_ptr<MockCapability> cap = std::make_shared<MockCapability>();
    std::unique_ptr<Server> server = make_server(cap);

    Response call(const Request& req) {
        auto resp = server->handle(req);
        EXPECT_TRUE(resp.has_value());
        return resp ? *resp : Response{};
    }
};

// ---- Routing ----

TEST_F(ServerTest, InitializeEchoesDeclaredCapabilities) {
    auto resp = call(make_request(1, "initialize", nlohmann::json::object()));
    ASSERT_TRUE(resp.is_success());
    EXPECT_EQ((*resp.result)["serverInfo"]["name"], "mock-server");
    EXPECT_EQ((*resp.result)["capabilities"]["resources"]["subscribe"], true);
    EXPECT_TRUE((*resp.result)["capabilities"].contains("prompts"));
    EXPECT_FALSE((*resp.result)["capabilities"].contains("tools"));
}

TEST_F(ServerTest, PingReturnsEmptyObject) {
    auto resp = call(make_request(2, "ping"));
    EXPECT_EQ(*resp.result, nlohmann::json::object());
    EXPECT_EQ(cap->pings.load(), 1);
}

TEST_F(ServerTest, ToolsListPaginates) {
    auto first = call(make_request(1, "tools/list"));
    EXPECT_EQ((*first.result)["tools"][0]["name"], "echo");
    EXPECT_EQ((*first.result)["nextCursor"], "page-2");

    auto second = call(make_request(2, "tools/list", nlohmann::json{{"cursor", "page-2"}}));
    EXPECT_EQ((*second.result)["tools"][0]["name"], "slow");
    EXPECT_FALSE(second.result->contains("nextCursor"));
}

TEST_F(ServerTest, UnknownMethod) {
    auto resp = call(make_request(3, "tools/frobnicate"));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(resp.error->message, "Method not found: tools/frobnicate");
    EXPECT_EQ(resp.id, 3);
}

TEST_F(ServerTest, ResponseEchoesStringId) {
    auto resp = call(make_request("abc", "ping"));
    EXPECT_EQ(resp.id, "abc");
}

// ---- Version shaping ----

TEST_F(ServerTest, V1RequestGetsV1Response) {
    auto resp = call(make_request(1, "ping", std::nullopt, std::string("1.0")));
    EXPECT_TRUE(resp.is_v1());
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_TRUE(j.contains("error"));
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_FALSE(j.contains("jsonrpc"));
}

TEST_F(ServerTest, MissingVersionIsV1) {
    auto resp = call(make_request(1, "nope", std::nullopt, std::nullopt));
    EXPECT_TRUE(resp.is_v1());
    EXPECT_TRUE(resp.is_error());
    EXPECT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->is_null());
}

TEST_F(ServerTest, InvalidVersionFallsBackToV2) {
    auto resp = call(make_request(4, "nope", std::nullopt, std::string("9.9")));
    EXPECT_TRUE(resp.is_v2());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
}

// ---- Validation ----

TEST_F(ServerTest, ToolsCallWithoutParams) {
    auto resp = call(make_request(1, "tools/call"));
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->message, "Missing parameters: params object");
}

TEST_F(ServerTest, ToolsCallWithoutName) {
    auto resp = call(make_request(1, "tools/call", nlohmann::json{{"arguments", {}}}));
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->message, "Missing tool name");
    EXPECT_EQ(cap->tool_calls.load(), 0);
}

TEST_F(ServerTest, ResourcesReadWithoutUri) {
    auto resp = call(make_request(1, "resources/read", nlohmann::json::object()));
    EXPECT_EQ(resp.error->message, "Missing parameters: uri");
}

TEST_F(ServerTest, PromptsGetWithoutName) {
    auto resp = call(make_request(1, "prompts/get", nlohmann::json{{"arguments", {}}}));
    EXPECT_EQ(resp.error->message, "Missing parameters: name");
}

TEST_F(ServerTest, SetLevelRequiresLevel) {
    auto bad = call(make_request(1, "logging/setLevel", nlohmann::json::object()));
    EXPECT_EQ(bad.error->code, error::InvalidParams);

    auto good = call(make_request(2, "logging/setLevel", nlohmann::json{{"level", "debug"}}));
    EXPECT_TRUE(good.is_success());
    EXPECT_EQ(cap->log_level, "debug");
}

TEST_F(ServerTest, CompletionRequiresParams) {
    auto bad = call(make_request(1, "completion/complete"));
    EXPECT_EQ(bad.error->code, error::InvalidParams);

    auto good = call(make_request(2, "completion/complete",
                                  nlohmann::json{{"ref", {{"type", "ref/prompt"}}}}));
    EXPECT_EQ((*good.result)["completion"]["values"][0], "ls -la");
}

// ---- Capability failures ----

TEST_F(ServerTest, UnknownToolIsInvalidParams) {
    auto resp = call(make_request(1, "tools/call", nlohmann::json{{"name", "nope"}}));
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->message, "Unknown tool: nope");
}

TEST_F(ServerTest, ThrowingToolIsInternalError) {
    auto resp = call(make_request(1, "tools/call", nlohmann::json{{"name", "boom"}}));
    EXPECT_EQ(resp.error->code, error::InternalError);
    EXPECT_EQ(resp.error->message, "Internal error: tool exploded");
}

TEST_F(ServerTest, ToolReportedErrorIsStillSuccess) {
    auto resp = call(make_request(1, "tools/call", nlohmann::json{{"name", "fail"}}));
    ASSERT_TRUE(resp.is_success());
    EXPECT_EQ((*resp.result)["isError"], true);
}

TEST_F(ServerTest, ArgumentsDefaultToEmptyObject) {
    call(make_request(1, "tools/call", nlohmann::json{{"name", "echo"}}));
    std::lock_guard<std::mutex> lock(cap->mutex);
    EXPECT_EQ(cap->last_arguments, nlohmann::json::object());
}

TEST_F(ServerTest, RegistryEmptyAfterCall) {
    call(make_request(1, "tools/call", nlohmann::json{{"name", "echo"}, {"arguments", {{"text", "x"}}}}));
    EXPECT_EQ(server->active_request_count(), 0u);
    call(make_request(2, "tools/call", nlohmann::json{{"name", "boom"}}));
    EXPECT_EQ(server->active_request_count(), 0u);
}

// ---- Notifications ----

TEST_F(ServerTest, NotificationsProduceNoResponse) {
    EXPECT_FALSE(server->handle(make_notification("notifications/initialized",
                                                  nlohmann::json::object())).has_value());
    EXPECT_FALSE(server->handle(make_notification("notifications/cancelled",
                                                  nlohmann::json{{"requestId", 99}})).has_value());
}

TEST_F(ServerTest, CancelUnknownRequestSkipsHook) {
    server->handle(make_notification("notifications/cancelled",
                                     nlohmann::json{{"requestId", "ghost"}}));
    EXPECT_TRUE(cap->cancellations().empty());
}

TEST_F(ServerTest, MalformedCancellationIgnored) {
    EXPECT_FALSE(server->handle(make_notification("notifications/cancelled",
                                                  nlohmann::json{{"requestId", {1, 2}}})).has_value());
    EXPECT_FALSE(server->handle(make_notification("notifications/cancelled",
                                                  nlohmann::json::array())).has_value());
}

// ---- Subscriptions ----

TEST_F(ServerTest, SubscribeThenNotify) {
    auto stream = server->resource_update_stream();
    ASSERT_TRUE(stream.has_value());

    EXPECT_FALSE(server->notify_resource_updated("memo://one"));
    auto resp = call(make_request(1, "resources/subscribe", nlohmann::json{{"uri", "memo://one"}}));
    EXPECT_TRUE(resp.is_success());
    EXPECT_TRUE(server->is_subscribed("memo://one"));
    EXPECT_TRUE(server->notify_resource_updated("memo://one"));

    auto n = stream->next();
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(std::get<ResourceUpdatedNotification>(*n).uri, "memo://one");
}

TEST_F(ServerTest, SubscribeFailureLeavesSetUnchanged) {
    auto resp = call(make_request(1, "resources/subscribe", nlohmann::json{{"uri", "memo://forbidden"}}));
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_FALSE(server->is_subscribed("memo://forbidden"));
}

TEST_F(ServerTest, UnsubscribeNeverSubscribedSucceeds) {
    auto resp = call(make_request(1, "resources/unsubscribe", nlohmann::json{{"uri", "memo://two"}}));
    EXPECT_TRUE(resp.is_success());
    EXPECT_EQ(cap->unsubscribe_calls.size(), 1u);
}

TEST_F(ServerTest, NotificationStreamTakenOnce) {
    EXPECT_TRUE(server->take_notification_stream().has_value());
    EXPECT_FALSE(server->take_notification_stream().has_value());
    EXPECT_FALSE(server->progress_stream().has_value());
}

// ---- Raw lines ----

TEST_F(ServerTest, HandleLineParseError) {
    auto out = server->handle_line("{\"id\":1,");
    ASSERT_TRUE(out.has_value());
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["error"]["code"], -32700);
    EXPECT_TRUE(j["id"].is_null());
}

TEST_F(ServerTest, HandleLineBadProgressToken) {
    std::optional<std::string> out;
    ASSERT_NO_THROW(out = server->handle_line(
        R"({"jsonrpc":"2.0","id":1,"method":"ping","_meta":{"progressToken":1.5}})"));
    ASSERT_TRUE(out.has_value());
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["error"]["code"], -32700);
    EXPECT_TRUE(j["id"].is_null());
}

TEST_F(ServerTest, HandleLineAsyncBadProgressTokenStillAnswers) {
    std::promise<std::optional<std::string>> done;
    auto fut = done.get_future();
    server->handle_line_async(R"({"jsonrpc":"2.0","id":1,"method":"ping","_meta":{"progressToken":[1]}})",
                              [&done](std::optional<std::string> out) {
                                  done.set_value(std::move(out));
                              });
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto out = fut.get();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(nlohmann::json::parse(*out)["error"]["code"], -32700);
}

TEST_F(ServerTest, HandleLineTooLarge) {
    auto small = ServerBuilder().with_max_message_size(16).with_thread_pool_size(1).build(cap);
    auto out = small->handle_line(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_TRUE(out.has_value());
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["error"]["message"], "Request too large");
}

TEST_F(ServerTest, HandleLineRoundTrip) {
    auto out = server->handle_line(R"({"jsonrpc":"2.0","id":5,"method":"ping"})");
    ASSERT_TRUE(out.has_value());
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 5);
    EXPECT_EQ(j["result"], nlohmann::json::object());
}

TEST_F(ServerTest, HandleLineNotification) {
    EXPECT_FALSE(server->handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")
                     .has_value());
}

// ---- Async ----

TEST_F(ServerTest, HandleAsync) {
    std::promise<std::optional<Response>> done;
    auto fut = done.get_future();
    server->handle_async(make_request(8, "ping"), [&done](std::optional<Response> r) {
        done.set_value(std::move(r));
    });
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->id, 8);
}

TEST_F(ServerTest, HandleLineAsync) {
    std::promise<std::optional<std::string>> done;
    auto fut = done.get_future();
    server->handle_line_async(R"({"id":"q","method":"ping"})",
                              [&done](std::optional<std::string> out) {
                                  done.set_value(std::move(out));
                              });
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto out = fut.get();
    ASSERT_TRUE(out.has_value());
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["id"], "q");
    EXPECT_TRUE(j.contains("error"));
}

// ---- Builder ----

TEST(ServerBuilder, ToolsCapabilityListsDescriptors) {
    Tool t;
    t.name = "bash";
    auto opts = ServerBuilder().with_tools({t}).options();
    ASSERT_TRUE(opts.capabilities.tools.has_value());
    EXPECT_EQ((*opts.capabilities.tools)["tools"][0]["name"], "bash");
}

TEST(ServerBuilder, Defaults) {
    auto opts = ServerBuilder().options();
    EXPECT_EQ(opts.thread_pool_size, 4);
    EXPECT_EQ(opts.max_message_size, 4u * 1024 * 1024);
    EXPECT_FALSE(opts.capabilities.tools.has_value());
    EXPECT_FALSE(opts.capabilities.resources.has_value());
}

// ---- Wire scenarios ----

TEST_F(ServerTest, TaggedPingLine) {
    auto out = server->handle_line(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(nlohmann::json::parse(*out),
              nlohmann::json::parse(R"({"jsonrpc":"2.0","id":1,"result":{}})"));
}

TEST_F(ServerTest, UntaggedPingLineIsV1Shaped) {
    auto out = server->handle_line(R"({"id":1,"method":"ping"})");
    EXPECT_EQ(nlohmann::json::parse(*out),
              nlohmann::json::parse(R"({"id":1,"result":{},"error":null})"));
}

TEST_F(ServerTest, UnknownToolLine) {
    auto out = server->handle_line(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"missing"}})");
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["error"]["code"], -32602);
    EXPECT_EQ(j["error"]["message"], "Unknown tool: missing");
}

TEST_F(ServerTest, UnknownVersionLineIsV2Shaped) {
    auto out = server->handle_line(R"({"jsonrpc":"9.9","id":3,"method":"nope"})");
    auto j = nlohmann::json::parse(*out);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_FALSE(j.contains("result"));
}
