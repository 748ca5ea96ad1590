// tool_adapter.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "message_store.hpp"

constexpr size_t kDefaultFetchLimit = 50;
constexpr size_t kMaxFetchLimit = 200;

struct PostMessageRequest {
    std::string channel; // "target" on the wire
    std::string sender;
    std::string text;
};

struct FetchMessagesRequest {
    std::string channel;
    uint64_t since_id = 0;
    size_t limit = kDefaultFetchLimit;
};

// Both throw ValidationError when a required field is missing or a field has
// the wrong JSON type.
PostMessageRequest parse_post_request(const nlohmann::json& args);
FetchMessagesRequest parse_fetch_request(const nlohmann::json& args);

struct ToolResult {
    bool is_error = false;
    nlohmann::json payload;
};

// Exposes the store as the post_message / fetch_messages / list_channels tools.
class ToolAdapter {
public:
    explicit ToolAdapter(MessageStore& store);

    bool has_tool(const std::string& name) const;
    nlohmann::json tool_descriptors() const;

    // Store errors come back as is_error results; an unknown name throws
    // std::invalid_argument.
    ToolResult call(const std::string& name, const nlohmann::json& args);

    nlohmann::json post_message(const PostMessageRequest& req);
    nlohmann::json fetch_messages(const FetchMessagesRequest& req);
    nlohmann::json list_channels();

private:
    MessageStore& store_;
};
