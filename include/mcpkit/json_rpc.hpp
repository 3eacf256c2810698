#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpkit {

/// Client-chosen key correlating progress notifications with a call.
using ProgressToken = std::variant<int64_t, std::string>;

inline void to_json(nlohmann::json& j, const ProgressToken& token) {
    std::visit([&j](const auto& v) { j = v; }, token);
}

inline void from_json(const nlohmann::json& j, ProgressToken& token) {
    if (j.is_number_integer()) {
        token = j.get<int64_t>();
    } else if (j.is_string()) {
        token = j.get<std::string>();
    } else {
        throw std::invalid_argument("ProgressToken must be integer or string");
    }
}

enum class JsonRpcVersion { V1, V2 };

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

struct RequestMeta {
    std::optional<ProgressToken> progress_token;

    bool operator==(const RequestMeta& o) const {
        return progress_token == o.progress_token;
    }
};

/// Inbound message. An absent (or null) id makes it a notification.
struct Request {
    std::optional<std::string> jsonrpc;
    std::optional<nlohmann::json> id;
    std::string method;
    std::optional<nlohmann::json> params;
    std::optional<RequestMeta> meta;

    bool is_notification() const { return !id || id->is_null(); }

    /// Token from the top-level `_meta`, falling back to `params._meta`.
    std::optional<ProgressToken> progress_token() const;

    bool operator==(const Request& o) const {
        return jsonrpc == o.jsonrpc && id == o.id && method == o.method
               && params == o.params && meta == o.meta;
    }
};

/// Resolve the version tag: "2.0" is V2, "1.0" or absent is V1.
/// Throws McpError(InvalidVersion) for any other literal.
JsonRpcVersion detect_version(const Request& req);

struct Response {
    std::optional<std::string> jsonrpc;   // set only for 2.0
    nlohmann::json id;                    // null when no id could be parsed
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    static Response v1_success(nlohmann::json id, nlohmann::json result);
    static Response v1_error(nlohmann::json id, JsonRpcError error);
    static Response v2_success(nlohmann::json id, nlohmann::json result);
    static Response v2_error(nlohmann::json id, JsonRpcError error);

    static Response success(JsonRpcVersion version, nlohmann::json id, nlohmann::json result);
    static Response failure(JsonRpcVersion version, nlohmann::json id, JsonRpcError error);

    // Ready-made rejections for input that never became a Request.
    static Response parse_error();
    static Response too_large();

    bool is_v1() const { return !jsonrpc.has_value(); }
    bool is_v2() const { return jsonrpc.has_value(); }
    bool is_success() const { return !error.has_value(); }
    bool is_error() const { return error.has_value(); }

    bool operator==(const Response& o) const {
        return jsonrpc == o.jsonrpc && id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const RequestMeta& m);
void from_json(const nlohmann::json& j, RequestMeta& m);

void to_json(nlohmann::json& j, const Request& r);
void from_json(const nlohmann::json& j, Request& r);

void to_json(nlohmann::json& j, const Response& r);
void from_json(const nlohmann::json& j, Response& r);

} // namespace mcpkit
