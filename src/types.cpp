#include "mcpkit/types.hpp"
#include <stdexcept>

namespace mcpkit {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

} // anonymous namespace

// ---------- Resource contents ----------

void to_json(nlohmann::json& j, const TextResourceContents& t) {
    j = {{"uri", t.uri}, {"text", t.text}};
    put_optional(j, "mimeType", t.mime_type);
}

void to_json(nlohmann::json& j, const BlobResourceContents& t) {
    j = {{"uri", t.uri}, {"blob", t.blob}};
    put_optional(j, "mimeType", t.mime_type);
}

void to_json(nlohmann::json& j, const ResourceContents& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, ResourceContents& c) {
    std::optional<std::string> mime;
    if (j.contains("mimeType")) mime = j.at("mimeType").get<std::string>();
    const auto uri = j.at("uri").get<std::string>();
    if (j.contains("text")) {
        c = TextResourceContents{uri, mime, j.at("text").get<std::string>()};
    } else if (j.contains("blob")) {
        c = BlobResourceContents{uri, mime, j.at("blob").get<std::string>()};
    } else {
        throw std::invalid_argument("Resource contents need 'text' or 'blob': " + uri);
    }
}

// ---------- Content blocks ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource;
    to_json(resource, t.resource);
    j = {{"type", "resource"}, {"resource", resource}};
}

void to_json(nlohmann::json& j, const ContentBlock& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, ContentBlock& c) {
    const auto type = j.at("type").get<std::string>();
    if (type == "text") {
        c = TextContent{j.at("text").get<std::string>()};
    } else if (type == "image") {
        c = ImageContent{j.at("data").get<std::string>(), j.at("mimeType").get<std::string>()};
    } else if (type == "resource") {
        EmbeddedResource embedded;
        from_json(j.at("resource"), embedded.resource);
        c = std::move(embedded);
    } else {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
}

// ---------- Tools ----------

void to_json(nlohmann::json& j, const ToolInputSchema& t) {
    j = {{"type", t.type}};
    if (!t.properties.empty()) j["properties"] = t.properties;
    if (!t.required.empty()) j["required"] = t.required;
}

void from_json(const nlohmann::json& j, ToolInputSchema& t) {
    t.type = j.value("type", std::string("object"));
    if (j.contains("properties")) {
        t.properties = j.at("properties").get<std::map<std::string, nlohmann::json>>();
    }
    if (j.contains("required")) t.required = j.at("required").get<std::vector<std::string>>();
}

void to_json(nlohmann::json& j, const ToolAnnotations& t) {
    j = nlohmann::json::object();
    put_optional(j, "readOnlyHint", t.read_only_hint);
    put_optional(j, "idempotentHint", t.idempotent_hint);
}

void to_json(nlohmann::json& j, const Tool& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    put_optional(j, "title", t.title);
    put_optional(j, "description", t.description);
    put_optional(j, "outputSchema", t.output_schema);
    put_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(std::move(cj));
    }
    put_optional(j, "structuredContent", t.structured_content);
    j["isError"] = t.is_error;
}

// ---------- Resources ----------

void to_json(nlohmann::json& j, const Resource& t) {
    j = {{"uri", t.uri}, {"name", t.name}};
    put_optional(j, "title", t.title);
    put_optional(j, "description", t.description);
    put_optional(j, "mimeType", t.mime_type);
    put_optional(j, "size", t.size);
}

void to_json(nlohmann::json& j, const ResourceTemplate& t) {
    j = {{"uriTemplate", t.uri_template}, {"name", t.name}};
    put_optional(j, "title", t.title);
    put_optional(j, "description", t.description);
    put_optional(j, "mimeType", t.mime_type);
}

void to_json(nlohmann::json& j, const ReadResourceResult& t) {
    j = {{"contents", nlohmann::json::array()}};
    for (const auto& c : t.contents) {
        nlohmann::json cj;
        to_json(cj, c);
        j["contents"].push_back(std::move(cj));
    }
}

// ---------- Prompts ----------

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = {{"name", t.name}, {"required", t.required}};
    put_optional(j, "title", t.title);
    put_optional(j, "description", t.description);
}

void to_json(nlohmann::json& j, const Prompt& t) {
    j = {{"name", t.name}};
    put_optional(j, "title", t.title);
    put_optional(j, "description", t.description);
    put_optional(j, "arguments", t.arguments);
}

void to_json(nlohmann::json& j, const PromptMessage& t) {
    nlohmann::json content_j;
    to_json(content_j, t.content);
    j = {{"role", t.role}, {"content", content_j}};
}

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = {{"messages", t.messages}};
    put_optional(j, "description", t.description);
}

// ---------- Completion ----------

void to_json(nlohmann::json& j, const CompletionResult& t) {
    nlohmann::json completion = {{"values", t.values}};
    put_optional(completion, "hasMore", t.has_more);
    put_optional(completion, "total", t.total);
    j = {{"completion", completion}};
}

// ---------- Initialization ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    put_optional(j, "tools", t.tools);
    put_optional(j, "prompts", t.prompts);
    put_optional(j, "resources", t.resources);
    put_optional(j, "completions", t.completions);
    put_optional(j, "logging", t.logging);
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("prompts")) t.prompts = j.at("prompts");
    if (j.contains("resources")) t.resources = j.at("resources");
    if (j.contains("completions")) t.completions = j.at("completions");
    if (j.contains("logging")) t.logging = j.at("logging");
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    put_optional(j, "title", t.title);
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    put_optional(j, "instructions", t.instructions);
}

// ---------- LogLevel ----------

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
    }
    return "info";
}

LogLevel log_level_from_string(const std::string& s) {
    static const std::map<std::string, LogLevel> names = {
        {"debug", LogLevel::Debug},       {"info", LogLevel::Info},
        {"notice", LogLevel::Notice},     {"warning", LogLevel::Warning},
        {"error", LogLevel::Error},       {"critical", LogLevel::Critical},
        {"alert", LogLevel::Alert},       {"emergency", LogLevel::Emergency},
    };
    auto it = names.find(s);
    if (it == names.end()) throw std::invalid_argument("Unknown log level: " + s);
    return it->second;
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

} // namespace mcpkit
