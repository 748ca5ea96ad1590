// mcp_endpoint.cpp
#include "mcp_endpoint.hpp"
#include <chrono>
#include <cstdio>
#include <random>
#include <stdexcept>
#include "logger.hpp"

using json = nlohmann::json;

namespace {

// thrown inside dispatch and turned into a JSON-RPC error object
struct RpcFailure : std::runtime_error {
    RpcFailure(RpcError c, const std::string& what_arg) : std::runtime_error(what_arg), code(c) {}
    RpcError code;
};

json rpc_result(const json& id, json result) {
    return { {"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)} };
}

} // namespace

json rpc_error(const json& id, RpcError code, const std::string& message) {
    return { {"jsonrpc", "2.0"}, {"id", id},
             {"error", { {"code", static_cast<int>(code)}, {"message", message} }} };
}

McpEndpoint::McpEndpoint(ToolAdapter& tools) : tools_(tools) {}

McpReply McpEndpoint::handle(const std::string& request_body) {
    McpReply reply;
    json request;
    try {
        request = json::parse(request_body);
    } catch (const json::parse_error& ex) {
        Logger::instance().warn("MCP parse error", { {"what", ex.what()}, {"body_len", static_cast<uint64_t>(request_body.size())} });
        reply.status = 400;
        reply.body = rpc_error(nullptr, RpcError::ParseError, "Parse error").dump();
        return reply;
    }

    bool opened_session = false;
    json response;
    if (request.is_array()) {
        if (request.empty()) {
            reply.status = 400;
            reply.body = rpc_error(nullptr, RpcError::InvalidRequest, "Empty batch").dump();
            return reply;
        }
        response = json::array();
        for (const auto& item : request) {
            auto r = dispatch(item, opened_session);
            if (r) response.push_back(std::move(*r));
        }
        if (response.empty()) response = nullptr;
    } else {
        auto r = dispatch(request, opened_session);
        if (r) response = std::move(*r);
    }

    if (opened_session) reply.session_id = new_session_id();
    if (response.is_null()) {
        reply.status = 202;
        return reply;
    }
    reply.body = response.dump(-1, ' ', false, json::error_handler_t::replace);
    return reply;
}

std::optional<json> McpEndpoint::dispatch(const json& request, bool& opened_session) {
    if (!request.is_object() || !request.contains("jsonrpc") || request["jsonrpc"] != "2.0" ||
        !request.contains("method") || !request["method"].is_string()) {
        json id = (request.is_object() && request.contains("id")) ? request["id"] : json(nullptr);
        return rpc_error(id, RpcError::InvalidRequest, "Invalid Request");
    }

    const std::string method = request["method"].get<std::string>();
    const bool is_notification = !request.contains("id");
    const json id = is_notification ? json(nullptr) : request["id"];
    const json params = request.contains("params") ? request["params"] : json::object();
    Logger::instance().debug("MCP request", { {"method", method}, {"notification", is_notification} });

    if (is_notification) return std::nullopt;

    try {
        if (!params.is_object()) throw RpcFailure(RpcError::InvalidParams, "params must be an object");
        if (method == "initialize") {
            opened_session = true;
            return rpc_result(id, handle_initialize(params));
        }
        if (method == "ping") return rpc_result(id, json::object());
        if (method == "tools/list") return rpc_result(id, { {"tools", tools_.tool_descriptors()} });
        if (method == "tools/call") return rpc_result(id, handle_tools_call(params));
        throw RpcFailure(RpcError::MethodNotFound, "Method not found: " + method);
    } catch (const RpcFailure& ex) {
        return rpc_error(id, ex.code, ex.what());
    }
}

json McpEndpoint::handle_initialize(const json& params) {
    std::string version = kProtocolVersion;
    auto it = params.find("protocolVersion");
    if (it != params.end() && it->is_string()) version = it->get<std::string>();
    std::string client = "unknown";
    auto info = params.find("clientInfo");
    if (info != params.end() && info->is_object()) client = info->value("name", "unknown");
    Logger::instance().info("MCP session initialized", { {"client", client}, {"protocol_version", version} });

    return {
        {"protocolVersion", version},
        {"capabilities", { {"tools", { {"listChanged", false} }} }},
        {"serverInfo", { {"name", kServerName}, {"version", kServerVersion} }}
    };
}

json McpEndpoint::handle_tools_call(const json& params) {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string())
        throw RpcFailure(RpcError::InvalidParams, "tools/call requires a tool name");
    const std::string name = name_it->get<std::string>();
    if (!tools_.has_tool(name)) throw RpcFailure(RpcError::InvalidParams, "Unknown tool: " + name);

    json args = params.contains("arguments") ? params["arguments"] : json::object();
    ToolResult result = tools_.call(name, args);
    return {
        {"content", json::array({ { {"type", "text"}, {"text", result.payload.dump(-1, ' ', false, json::error_handler_t::replace)} } })},
        {"structuredContent", result.payload},
        {"isError", result.is_error}
    };
}

std::string McpEndpoint::new_session_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}() ^
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(rng()),
                  static_cast<unsigned long long>(++session_counter_));
    return buf;
}
