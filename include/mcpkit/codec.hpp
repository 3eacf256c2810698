#pragma once
#include "json_rpc.hpp"
#include "notification.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcpkit {

class Codec {
public:
    /// Parse one raw line into a Request.
    /// Throws McpParseError on invalid JSON, a non-object message, a
    /// missing/non-string "method", or any field of the wrong type
    /// (including a progressToken that is neither integer nor string).
    [[nodiscard]] static Request parse_request(std::string_view raw);

    /// Parse raw bytes into a JSON value (no shape checks).
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Serialize to a single line (no trailing newline).
    [[nodiscard]] static std::string serialize(const Response& resp);
    [[nodiscard]] static std::string serialize(const ServerNotification& n);
};

} // namespace mcpkit
