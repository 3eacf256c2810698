#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpkit {

// Descriptor and payload shapes exchanged with a Capability. The dispatcher
// only serializes these; it never inspects them.

// ---------- Resource contents ----------

struct TextResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::string text;

    bool operator==(const TextResourceContents& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text;
    }
};

/// Binary payload, base64 encoded.
struct BlobResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::string blob;

    bool operator==(const BlobResourceContents& o) const {
        return uri == o.uri && mime_type == o.mime_type && blob == o.blob;
    }
};

using ResourceContents = std::variant<TextResourceContents, BlobResourceContents>;

// ---------- Content blocks ----------
// Tool results and prompt messages carry text, base64 images or a whole
// embedded resource.

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct ImageContent {
    std::string data;
    std::string mime_type;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type;
    }
};

struct EmbeddedResource {
    ResourceContents resource;

    bool operator==(const EmbeddedResource& o) const { return resource == o.resource; }
};

using ContentBlock = std::variant<TextContent, ImageContent, EmbeddedResource>;

// ---------- Tools ----------

struct ToolInputSchema {
    std::string type = "object";
    std::map<std::string, nlohmann::json> properties;
    std::vector<std::string> required;

    bool operator==(const ToolInputSchema& o) const {
        return type == o.type && properties == o.properties && required == o.required;
    }
};

struct ToolAnnotations {
    std::optional<bool> read_only_hint;
    std::optional<bool> idempotent_hint;

    bool operator==(const ToolAnnotations& o) const {
        return read_only_hint == o.read_only_hint && idempotent_hint == o.idempotent_hint;
    }
};

struct Tool {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    ToolInputSchema input_schema;
    std::optional<ToolInputSchema> output_schema;
    std::optional<ToolAnnotations> annotations;

    bool operator==(const Tool& o) const {
        return name == o.name && title == o.title && description == o.description
               && input_schema == o.input_schema && output_schema == o.output_schema
               && annotations == o.annotations;
    }
};

struct CallToolResult {
    std::vector<ContentBlock> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }
};

// ---------- Resources ----------

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::optional<uint64_t> size;
};

struct ResourceTemplate {
    std::string uri_template;
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

struct ReadResourceResult {
    std::vector<ResourceContents> contents;
};

// ---------- Prompts ----------

struct PromptArgument {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::vector<PromptArgument>> arguments;
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    ContentBlock content;
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;
};

// ---------- Completion ----------

struct CompletionResult {
    std::vector<std::string> values; // max 100
    std::optional<bool> has_more;
    std::optional<uint32_t> total;
};

// ---------- Listing ----------

/// One page of a cursor-paginated listing.
template <typename T>
struct Page {
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

// ---------- Initialization ----------

/// Capability groups a server advertises. Each present member is the
/// (possibly empty) options object for that group.
struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> prompts;
    std::optional<nlohmann::json> resources;
    std::optional<nlohmann::json> completions;
    std::optional<nlohmann::json> logging;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && prompts == o.prompts && resources == o.resources
               && completions == o.completions && logging == o.logging;
    }
};

struct Implementation {
    std::string name;
    std::string version;
    std::optional<std::string> title;
};

struct InitializeResult {
    std::string protocol_version;
    Implementation server_info;
    ServerCapabilities capabilities;
    std::optional<std::string> instructions;
};

// ---------- Logging ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
/// Throws std::invalid_argument for names outside the syslog set.
LogLevel log_level_from_string(const std::string& s);

// ---------- JSON serialization ----------


void to_json(nlohmann::json& j, const TextResourceContents& t);
void to_json(nlohmann::json& j, const BlobResourceContents& t);
void to_json(nlohmann::json& j, const ResourceContents& c);
void from_json(const nlohmann::json& j, ResourceContents& c);

void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const ImageContent& t);
void to_json(nlohmann::json& j, const EmbeddedResource& t);
void to_json(nlohmann::json& j, const ContentBlock& c);
void from_json(const nlohmann::json& j, ContentBlock& c);

void to_json(nlohmann::json& j, const ToolInputSchema& t);
void from_json(const nlohmann::json& j, ToolInputSchema& t);

void to_json(nlohmann::json& j, const ToolAnnotations& t);
void to_json(nlohmann::json& j, const Tool& t);
void to_json(nlohmann::json& j, const CallToolResult& t);

void to_json(nlohmann::json& j, const Resource& t);
void to_json(nlohmann::json& j, const ResourceTemplate& t);
void to_json(nlohmann::json& j, const ReadResourceResult& t);

void to_json(nlohmann::json& j, const PromptArgument& t);
void to_json(nlohmann::json& j, const Prompt& t);
void to_json(nlohmann::json& j, const PromptMessage& t);
void to_json(nlohmann::json& j, const GetPromptResult& t);

void to_json(nlohmann::json& j, const CompletionResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

/// Serialize a page under `key` ("tools", "resources", ...), adding
/// `nextCursor` only when another page exists.
template <typename T>
nlohmann::json page_to_json(const Page<T>& page, const char* key) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : page.items) {
        nlohmann::json ij;
        to_json(ij, item);
        items.push_back(std::move(ij));
    }
    nlohmann::json j = {{key, std::move(items)}};
    if (page.next_cursor) j["nextCursor"] = *page.next_cursor;
    return j;
}

} // namespace mcpkit
