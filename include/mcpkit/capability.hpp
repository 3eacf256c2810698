#pragma once
#include "types.hpp"
#include "progress.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpkit {

/// Behaviour a server author plugs into the dispatcher.
///
/// Every method may be called concurrently from several worker threads.
/// Failures are reported by throwing: McpError for typed protocol failures
/// (UnknownTool, ResourceNotFound, ...), any other std::exception for
/// internal ones. No method is retried by the dispatcher.
class Capability {
public:
    virtual ~Capability() = default;

    /// `declared` is what the server was configured with; the returned
    /// result is sent back verbatim.
    virtual InitializeResult initialize(const ServerCapabilities& declared) = 0;

    virtual void ping() {}

    virtual Page<Tool> list_tools(const std::optional<std::string>& cursor) = 0;

    /// Runs on its own thread and may be abandoned if the peer cancels
    /// the request. Report progress through `progress`.
    virtual CallToolResult call_tool(const std::string& name,
                                     const nlohmann::json& arguments,
                                     const ProgressSender& progress) = 0;

    virtual Page<Resource> list_resources(const std::optional<std::string>& cursor) = 0;
    virtual ReadResourceResult read_resource(const std::string& uri) = 0;
    virtual Page<ResourceTemplate> list_resource_templates(
        const std::optional<std::string>& cursor) = 0;

    virtual void subscribe(const std::string& uri) = 0;
    virtual void unsubscribe(const std::string& uri) = 0;

    virtual Page<Prompt> list_prompts(const std::optional<std::string>& cursor) = 0;
    virtual GetPromptResult get_prompt(const std::string& name,
                                       const nlohmann::json& arguments) = 0;

    virtual void set_log_level(const std::string& level) = 0;

    virtual CompletionResult complete(const nlohmann::json& params) = 0;

    /// Fire-and-forget hook, called after a cancellation has been applied.
    virtual void on_request_cancelled(const std::string& request_id,
                                      const std::optional<std::string>& reason) = 0;
};

} // namespace mcpkit
