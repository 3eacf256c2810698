#pragma once
#include <stdexcept>
#include <string>

namespace mcpkit {

struct JsonRpcError;

enum class ErrorKind {
    Parse,
    InvalidVersion,
    MethodNotFound,
    MissingParameters,
    MissingToolName,
    UnknownTool,
    UnknownPrompt,
    UnknownResource,
    ResourceNotFound,
    RequestCancelled,
    CommandTimeout,
    OutputTooLarge,
    Io,
    Serialization,
    Internal
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    // Outside the reserved JSON-RPC range.
    constexpr int RequestCancelled = -32800;
} // namespace error

/// Protocol error code for a failure kind.
int error_code(ErrorKind kind);

/// Base exception. Capability code throws it to report a typed failure;
/// the dispatcher turns it into a JsonRpcError.
class McpError : public std::runtime_error {
public:
    McpError(ErrorKind kind, std::string detail = {});

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }
    int code() const { return error_code(kind_); }

    JsonRpcError to_json_rpc_error() const;

private:
    ErrorKind kind_;
    std::string detail_;
};

class McpParseError : public McpError {
public:
    explicit McpParseError(std::string detail)
        : McpError(ErrorKind::Parse, std::move(detail)) {}
};

} // namespace mcpkit
