// tool_adapter.cpp
#include "tool_adapter.hpp"
#include <algorithm>
#include <stdexcept>
#include "logger.hpp"
#include "wire_integer.hpp"

using json = nlohmann::json;

namespace {

const json& require_object(const json& args) {
    static const json empty = json::object();
    if (args.is_null()) return empty;
    if (!args.is_object()) throw ValidationError("tool arguments must be a JSON object");
    return args;
}

std::string required_string(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) throw ValidationError(std::string("missing required argument: ") + key);
    if (!it->is_string()) throw ValidationError(std::string("argument must be a string: ") + key);
    return it->get<std::string>();
}

// Accepts JSON integers, integral floats and integral strings ("12");
// anything else is a validation error.
uint64_t optional_count(const json& args, const char* key, uint64_t fallback) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return fallback;
    auto v = json_saturating_uint(*it);
    if (!v) throw ValidationError(std::string("argument must be an integer: ") + key);
    return *v;
}

json messages_to_json(const std::vector<Message>& messages) {
    json out = json::array();
    for (const auto& m : messages) out.push_back(message_to_json(m));
    return out;
}

} // namespace

PostMessageRequest parse_post_request(const json& args) {
    const json& a = require_object(args);
    return PostMessageRequest{ required_string(a, "target"), required_string(a, "sender"), required_string(a, "text") };
}

FetchMessagesRequest parse_fetch_request(const json& args) {
    const json& a = require_object(args);
    FetchMessagesRequest req;
    req.channel = required_string(a, "target");
    req.since_id = optional_count(a, "since_id", 0);
    uint64_t limit = optional_count(a, "limit", kDefaultFetchLimit);
    req.limit = static_cast<size_t>(std::clamp<uint64_t>(limit, 1, kMaxFetchLimit));
    return req;
}

ToolAdapter::ToolAdapter(MessageStore& store) : store_(store) {}

bool ToolAdapter::has_tool(const std::string& name) const {
    return name == "post_message" || name == "fetch_messages" || name == "list_channels";
}

json ToolAdapter::tool_descriptors() const {
    json target = { {"type", "string"}, {"description", "Channel name, e.g. \"codex\", \"claude\" or a shared channel like \"proj-x\""} };
    return json::array({
        {
            {"name", "post_message"},
            {"description", "Post a message into a target inbox (channel). The channel is created on first post."},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"target", target},
                    {"sender", { {"type", "string"} }},
                    {"text", { {"type", "string"} }}
                }},
                {"required", json::array({"target", "sender", "text"})}
            }}
        },
        {
            {"name", "fetch_messages"},
            {"description", "Fetch messages for a target with id > since_id, oldest first."},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"target", target},
                    {"since_id", { {"type", "integer"}, {"default", 0} }},
                    {"limit", { {"type", "integer"}, {"default", kDefaultFetchLimit},
                                {"minimum", 1}, {"maximum", kMaxFetchLimit} }}
                }},
                {"required", json::array({"target"})}
            }}
        },
        {
            {"name", "list_channels"},
            {"description", "List known channels: configured ones first, then channels created by traffic."},
            {"inputSchema", { {"type", "object"}, {"properties", json::object()} }}
        }
    });
}

ToolResult ToolAdapter::call(const std::string& name, const json& args) {
    if (!has_tool(name)) throw std::invalid_argument("unknown tool: " + name);
    try {
        if (name == "post_message") return { false, post_message(parse_post_request(args)) };
        if (name == "fetch_messages") return { false, fetch_messages(parse_fetch_request(args)) };
        return { false, list_channels() };
    } catch (const StoreError& ex) {
        Logger::instance().warn("Tool call failed", { {"tool", name}, {"error", ex.kind_name()}, {"what", ex.what()} });
        return { true, { {"error", ex.kind_name()}, {"message", ex.what()} } };
    }
}

json ToolAdapter::post_message(const PostMessageRequest& req) {
    Message m = store_.post_message(req.channel, req.sender, req.text);
    return { {"ok", true}, {"posted", m.id}, {"message", message_to_json(m)} };
}

json ToolAdapter::fetch_messages(const FetchMessagesRequest& req) {
    auto messages = store_.fetch_messages(req.channel, req.since_id, req.limit);
    uint64_t latest = messages.empty() ? req.since_id : messages.back().id;
    Logger::instance().info("fetch_messages", {
        {"target", req.channel},
        {"since_id", req.since_id},
        {"limit", static_cast<uint64_t>(req.limit)},
        {"returned", static_cast<uint64_t>(messages.size())},
        {"latest_id", latest}
    });
    return { {"messages", messages_to_json(messages)}, {"latest_id", latest} };
}

json ToolAdapter::list_channels() {
    return { {"channels", store_.list_channels()} };
}
