#include <gtest/gtest.h>
#include "mcpkit/codec.hpp"
#include "mcpkit/error.hpp"

using namespace mcpkit;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto req = Codec::parse_request(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    EXPECT_EQ(req.jsonrpc, std::optional<std::string>("2.0"));
    ASSERT_TRUE(req.id.has_value());
    EXPECT_EQ(*req.id, 1);
    EXPECT_EQ(req.method, "ping");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_TRUE(req.params->is_object());
}

TEST(CodecParse, StringIdAndNoVersion) {
    auto req = Codec::parse_request(R"({"id":"abc-123","method":"tools/list"})");
    EXPECT_FALSE(req.jsonrpc.has_value());
    EXPECT_EQ(*req.id, "abc-123");
}

TEST(CodecParse, Notification) {
    auto req = Codec::parse_request(
        R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":3}})");
    EXPECT_TRUE(req.is_notification());
    EXPECT_EQ((*req.params)["requestId"], 3);
}

TEST(CodecParse, NestedValuesSurvive) {
    auto req = Codec::parse_request(
        R"({"id":9,"method":"tools/call","params":{"name":"x","arguments":{"list":[1,2.5,true,null,"s"]}}})");
    const auto& list = (*req.params)["arguments"]["list"];
    ASSERT_EQ(list.size(), 5u);
    EXPECT_EQ(list[0], 1);
    EXPECT_DOUBLE_EQ(list[1].get<double>(), 2.5);
    EXPECT_EQ(list[2], true);
    EXPECT_TRUE(list[3].is_null());
    EXPECT_EQ(list[4], "s");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse_request("{not json"), McpParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse_request(""), McpParseError);
}

TEST(CodecParse, NonObjectRoot) {
    EXPECT_THROW(Codec::parse_request(R"([1,2,3])"), McpParseError);
}

TEST(CodecParse, MissingMethod) {
    EXPECT_THROW(Codec::parse_request(R"({"jsonrpc":"2.0","id":1})"), McpParseError);
}

TEST(CodecParse, NonStringMethod) {
    EXPECT_THROW(Codec::parse_request(R"({"id":1,"method":5})"), McpParseError);
}

TEST(CodecParse, NonStringVersion) {
    EXPECT_THROW(Codec::parse_request(R"({"jsonrpc":2,"id":1,"method":"ping"})"), McpParseError);
}

TEST(CodecParse, FractionalProgressToken) {
    EXPECT_THROW(Codec::parse_request(
                     R"({"jsonrpc":"2.0","id":1,"method":"ping","_meta":{"progressToken":1.5}})"),
                 McpParseError);
}

TEST(CodecParse, ObjectProgressToken) {
    EXPECT_THROW(Codec::parse_request(
                     R"({"jsonrpc":"2.0","id":1,"method":"ping","_meta":{"progressToken":{"a":1}}})"),
                 McpParseError);
}

// ---- Serialize tests ----

TEST(CodecSerialize, SingleLine) {
    auto line = Codec::serialize(Response::v2_success(1, {{"text", "a\nb"}}));
    EXPECT_EQ(line.find('\n'), std::string::npos);
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["result"]["text"], "a\nb");
}

TEST(CodecSerialize, Notification) {
    ServerNotification n = ResourceUpdatedNotification{"memo://one"};
    auto j = nlohmann::json::parse(Codec::serialize(n));
    EXPECT_EQ(j["method"], "notifications/resources/updated");
    EXPECT_EQ(j["params"]["uri"], "memo://one");
}
