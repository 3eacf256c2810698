#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace mcpkit {

/// Request methods the dispatcher routes. Extend by growing the enum and
/// the name table in method.cpp.
enum class Method {
    Initialize,
    Ping,
    ToolsList,
    ToolsCall,
    ResourcesList,
    ResourcesRead,
    ResourceTemplatesList,
    ResourcesSubscribe,
    ResourcesUnsubscribe,
    PromptsList,
    PromptsGet,
    LoggingSetLevel,
    CompletionComplete
};

std::optional<Method> method_from_string(std::string_view name);
std::string_view method_name(Method m);

/// Only tools/call can be cancelled and receives a progress handle.
inline bool is_cancellable(Method m) { return m == Method::ToolsCall; }

constexpr std::string_view CANCELLED_NOTIFICATION = "notifications/cancelled";

} // namespace mcpkit
