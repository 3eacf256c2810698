#include "mcpkit/json_rpc.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/version.hpp"

namespace mcpkit {

std::optional<ProgressToken> Request::progress_token() const {
    if (meta && meta->progress_token) return meta->progress_token;
    if (params && params->is_object() && params->contains("_meta")) {
        const auto& inner = params->at("_meta");
        if (inner.is_object() && inner.contains("progressToken")) {
            const auto& tok = inner.at("progressToken");
            if (tok.is_number_integer() || tok.is_string()) {
                ProgressToken token;
                from_json(tok, token);
                return token;
            }
        }
    }
    return std::nullopt;
}

JsonRpcVersion detect_version(const Request& req) {
    if (!req.jsonrpc || *req.jsonrpc == JSONRPC_V1) return JsonRpcVersion::V1;
    if (*req.jsonrpc == JSONRPC_V2) return JsonRpcVersion::V2;
    throw McpError(ErrorKind::InvalidVersion, *req.jsonrpc);
}

// ---------- Response constructors ----------

Response Response::v1_success(nlohmann::json id, nlohmann::json result) {
    Response r;
    r.id = std::move(id);
    r.result = std::move(result);
    return r;
}

Response Response::v1_error(nlohmann::json id, JsonRpcError error) {
    Response r;
    r.id = std::move(id);
    r.result = nlohmann::json(nullptr);
    r.error = std::move(error);
    return r;
}

Response Response::v2_success(nlohmann::json id, nlohmann::json result) {
    Response r;
    r.jsonrpc = std::string(JSONRPC_V2);
    r.id = std::move(id);
    r.result = std::move(result);
    return r;
}

Response Response::v2_error(nlohmann::json id, JsonRpcError error) {
    Response r;
    r.jsonrpc = std::string(JSONRPC_V2);
    r.id = std::move(id);
    r.error = std::move(error);
    return r;
}

Response Response::success(JsonRpcVersion version, nlohmann::json id, nlohmann::json result) {
    return version == JsonRpcVersion::V2
        ? v2_success(std::move(id), std::move(result))
        : v1_success(std::move(id), std::move(result));
}

Response Response::failure(JsonRpcVersion version, nlohmann::json id, JsonRpcError error) {
    return version == JsonRpcVersion::V2
        ? v2_error(std::move(id), std::move(error))
        : v1_error(std::move(id), std::move(error));
}

Response Response::parse_error() {
    return v1_error(nullptr, JsonRpcError{error::ParseError, "Parse error", std::nullopt});
}

Response Response::too_large() {
    return v1_error(nullptr, JsonRpcError{error::ParseError, "Request too large", std::nullopt});
}

// ---------- Serialization ----------

void to_json(nlohmann::json& j, const RequestMeta& m) {
    j = nlohmann::json::object();
    if (m.progress_token) {
        nlohmann::json tok;
        to_json(tok, *m.progress_token);
        j["progressToken"] = tok;
    }
}

void from_json(const nlohmann::json& j, RequestMeta& m) {
    if (j.contains("progressToken") && !j.at("progressToken").is_null()) {
        ProgressToken token;
        from_json(j.at("progressToken"), token);
        m.progress_token = token;
    }
}

void to_json(nlohmann::json& j, const Request& r) {
    j = nlohmann::json::object();
    if (r.jsonrpc) j["jsonrpc"] = *r.jsonrpc;
    if (r.id) j["id"] = *r.id;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
    if (r.meta) j["_meta"] = *r.meta;
}

void from_json(const nlohmann::json& j, Request& r) {
    if (j.contains("jsonrpc")) r.jsonrpc = j.at("jsonrpc").get<std::string>();
    if (j.contains("id") && !j.at("id").is_null()) r.id = j.at("id");
    r.method = j.at("method").get<std::string>();
    if (j.contains("params") && !j.at("params").is_null()) r.params = j.at("params");
    if (j.contains("_meta") && !j.at("_meta").is_null()) r.meta = j.at("_meta").get<RequestMeta>();
}

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json::object();
    if (r.jsonrpc) {
        // 2.0: exactly one of result/error.
        j["jsonrpc"] = *r.jsonrpc;
        j["id"] = r.id;
        if (r.error) {
            j["error"] = *r.error;
        } else {
            j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
        }
    } else {
        // 1.0: both slots, null placeholder for the unused one.
        j["id"] = r.id;
        j["result"] = (r.result && !r.error) ? *r.result : nlohmann::json(nullptr);
        j["error"] = r.error ? nlohmann::json(*r.error) : nlohmann::json(nullptr);
    }
}

void from_json(const nlohmann::json& j, Response& r) {
    if (j.contains("jsonrpc")) r.jsonrpc = j.at("jsonrpc").get<std::string>();
    r.id = j.contains("id") ? j.at("id") : nlohmann::json(nullptr);
    if (j.contains("error") && !j.at("error").is_null()) {
        r.error = j.at("error").get<JsonRpcError>();
    }
    if (j.contains("result")) r.result = j.at("result");
}

} // namespace mcpkit
