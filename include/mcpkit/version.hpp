#pragma once
#include <string_view>

namespace mcpkit {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_V1          = "1.0";
constexpr std::string_view JSONRPC_V2          = "2.0";

} // namespace mcpkit
