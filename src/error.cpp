#include "mcpkit/error.hpp"
#include "mcpkit/json_rpc.hpp"

namespace mcpkit {

namespace {

std::string describe(ErrorKind kind, const std::string& detail) {
    switch (kind) {
        case ErrorKind::Parse:
            return detail.empty() ? "Parse error" : "Parse error: " + detail;
        case ErrorKind::InvalidVersion:   return "Invalid JSON-RPC version: " + detail;
        case ErrorKind::MethodNotFound:   return "Method not found: " + detail;
        case ErrorKind::MissingParameters:
            return detail.empty() ? "Missing parameters" : "Missing parameters: " + detail;
        case ErrorKind::MissingToolName:  return "Missing tool name";
        case ErrorKind::UnknownTool:      return "Unknown tool: " + detail;
        case ErrorKind::UnknownPrompt:    return "Unknown prompt: " + detail;
        case ErrorKind::UnknownResource:  return "Unknown resource: " + detail;
        case ErrorKind::ResourceNotFound: return "Resource not found: " + detail;
        case ErrorKind::RequestCancelled: return "Request cancelled: " + detail;
        case ErrorKind::CommandTimeout:   return "Command timeout";
        case ErrorKind::OutputTooLarge:   return "Output too large";
        case ErrorKind::Io:               return "IO error: " + detail;
        case ErrorKind::Serialization:    return "JSON error: " + detail;
        case ErrorKind::Internal:         return "Internal error: " + detail;
    }
    return detail;
}

} // anonymous namespace

int error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Parse:            return error::ParseError;
        case ErrorKind::InvalidVersion:   return error::InvalidRequest;
        case ErrorKind::MethodNotFound:   return error::MethodNotFound;
        case ErrorKind::MissingParameters:
        case ErrorKind::MissingToolName:
        case ErrorKind::UnknownTool:
        case ErrorKind::UnknownPrompt:
        case ErrorKind::UnknownResource:
        case ErrorKind::ResourceNotFound: return error::InvalidParams;
        case ErrorKind::RequestCancelled: return error::RequestCancelled;
        default:                          return error::InternalError;
    }
}

McpError::McpError(ErrorKind kind, std::string detail)
    : std::runtime_error(describe(kind, detail)),
      kind_(kind), detail_(std::move(detail)) {}

JsonRpcError McpError::to_json_rpc_error() const {
    return JsonRpcError{code(), what(), std::nullopt};
}

} // namespace mcpkit
