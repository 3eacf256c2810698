#include "mcpkit/method.hpp"
#include <array>
#include <utility>

namespace mcpkit {

namespace {

constexpr std::array<std::pair<Method, std::string_view>, 13> METHOD_NAMES{{
    {Method::Initialize,            "initialize"},
    {Method::Ping,                  "ping"},
    {Method::ToolsList,             "tools/list"},
    {Method::ToolsCall,             "tools/call"},
    {Method::ResourcesList,         "resources/list"},
    {Method::ResourcesRead,         "resources/read"},
    {Method::ResourceTemplatesList, "resources/templates/list"},
    {Method::ResourcesSubscribe,    "resources/subscribe"},
    {Method::ResourcesUnsubscribe,  "resources/unsubscribe"},
    {Method::PromptsList,           "prompts/list"},
    {Method::PromptsGet,            "prompts/get"},
    {Method::LoggingSetLevel,       "logging/setLevel"},
    {Method::CompletionComplete,    "completion/complete"},
}};

} // anonymous namespace

std::optional<Method> method_from_string(std::string_view name) {
    for (const auto& [m, n] : METHOD_NAMES) {
        if (n == name) return m;
    }
    return std::nullopt;
}

std::string_view method_name(Method m) {
    for (const auto& [candidate, n] : METHOD_NAMES) {
        if (candidate == m) return n;
    }
    return {};
}

} // namespace mcpkit
