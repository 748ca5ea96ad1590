// mcp_endpoint.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "tool_adapter.hpp"

// JSON-RPC 2.0 error codes
enum class RpcError : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

struct McpReply {
    unsigned status = 200;  // HTTP status
    std::string body;       // empty for 202
    std::string session_id; // set when the exchange opened a session
};

// Model Context Protocol over plain HTTP POST with JSON responses (no SSE).
// Exposes the relay tools through tools/list and tools/call.
class McpEndpoint {
public:
    static constexpr const char* kProtocolVersion = "2025-03-26";
    static constexpr const char* kServerName = "agent-relay";
    static constexpr const char* kServerVersion = "1.0.0";

    explicit McpEndpoint(ToolAdapter& tools);

    McpReply handle(const std::string& request_body);

private:
    // nullopt for notifications, which get no response
    std::optional<nlohmann::json> dispatch(const nlohmann::json& request, bool& opened_session);
    nlohmann::json handle_initialize(const nlohmann::json& params);
    nlohmann::json handle_tools_call(const nlohmann::json& params);
    std::string new_session_id();

    ToolAdapter& tools_;
    std::atomic<uint64_t> session_counter_{0};
};

nlohmann::json rpc_error(const nlohmann::json& id, RpcError code, const std::string& message);
