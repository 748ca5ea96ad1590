// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "logger.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what_arg) : std::runtime_error(what_arg) {}
};

struct RelayConfig {
    std::string host = "127.0.0.1";
    unsigned short port = 8010;
    std::string mcp_path = "/mcp";
    std::string log_path = "agent_relay.log";
    LogLevel log_level = LogLevel::Info;
    std::uint64_t log_max_bytes = 5ull * 1024 * 1024;
    int log_backup_count = 10;
    std::vector<std::string> channels{ "proj-x", "codex", "claude" };
    size_t io_threads = 0; // 0: hardware concurrency
    size_t max_messages_per_channel = 0; // 0: unbounded
    std::string service_name = "agent_relay";
};

// Resolves each field from the JSON file at config_path (when not empty), then
// from AGENT_RELAY_* environment variables, then the built-in default.
// Throws ConfigError on an unreadable file or a malformed value.
RelayConfig load_config(const std::string& config_path = "");

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> split_channel_list(const std::string& text);

nlohmann::json config_to_json(const RelayConfig& cfg);
