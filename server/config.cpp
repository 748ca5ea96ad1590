// config.cpp
#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

std::uint64_t parse_unsigned(const std::string& text, const std::string& what, std::uint64_t max_value) {
    std::string t = trim(text);
    if (t.empty() || t.find_first_not_of("0123456789") != std::string::npos)
        throw ConfigError(what + ": not a non-negative integer: '" + text + "'");
    std::uint64_t v = 0;
    try {
        v = std::stoull(t);
    } catch (const std::out_of_range&) {
        throw ConfigError(what + ": value out of range: '" + text + "'");
    }
    if (v > max_value) throw ConfigError(what + ": value out of range: '" + text + "'");
    return v;
}

json read_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file: " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        json j = json::parse(buffer.str());
        if (!j.is_object()) throw ConfigError("config file must hold a JSON object: " + path);
        return j;
    } catch (const json::parse_error& ex) {
        throw ConfigError("malformed config file " + path + ": " + ex.what());
    }
}

// One field: file value when the key is present, else the environment
// variable, else leave the default in place.
class FieldResolver {
public:
    explicit FieldResolver(const json& file) : file_(file) {}

    void string_field(const char* key, const char* env, std::string& out) const {
        if (file_.contains(key)) {
            if (!file_[key].is_string()) throw ConfigError(std::string(key) + ": expected a string");
            out = file_[key].get<std::string>();
        } else if (const char* v = env_value(env)) {
            out = v;
        }
    }

    template <typename T>
    void unsigned_field(const char* key, const char* env, T& out) const {
        const std::uint64_t max_value = std::numeric_limits<T>::max();
        if (file_.contains(key)) {
            const json& v = file_[key];
            if (v.is_number_unsigned()) {
                if (v.get<std::uint64_t>() > max_value) throw ConfigError(std::string(key) + ": value out of range");
                out = static_cast<T>(v.get<std::uint64_t>());
            } else if (v.is_string()) {
                out = static_cast<T>(parse_unsigned(v.get<std::string>(), key, max_value));
            } else {
                throw ConfigError(std::string(key) + ": expected a non-negative integer");
            }
        } else if (const char* v = env_value(env)) {
            out = static_cast<T>(parse_unsigned(v, env, max_value));
        }
    }

    void channels_field(const char* key, const char* env, std::vector<std::string>& out) const {
        if (file_.contains(key)) {
            const json& v = file_[key];
            if (v.is_string()) {
                out = split_channel_list(v.get<std::string>());
            } else if (v.is_array()) {
                std::vector<std::string> names;
                for (const auto& item : v) {
                    if (!item.is_string()) throw ConfigError(std::string(key) + ": expected an array of strings");
                    std::string name = trim(item.get<std::string>());
                    if (!name.empty()) names.push_back(name);
                }
                out = names;
            } else {
                throw ConfigError(std::string(key) + ": expected a string or an array of strings");
            }
        } else if (const char* v = env_value(env)) {
            out = split_channel_list(v);
        }
    }

private:
    const json& file_;
};

} // namespace

std::vector<std::string> split_channel_list(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

RelayConfig load_config(const std::string& config_path) {
    RelayConfig cfg;
    json file = config_path.empty() ? json::object() : read_config_file(config_path);
    FieldResolver r(file);

    r.string_field("host", "AGENT_RELAY_HOST", cfg.host);
    r.unsigned_field("port", "AGENT_RELAY_PORT", cfg.port);
    r.string_field("mcp_path", "AGENT_RELAY_MCP_PATH", cfg.mcp_path);
    r.string_field("log_path", "AGENT_RELAY_LOG_PATH", cfg.log_path);
    r.unsigned_field("log_max_bytes", "AGENT_RELAY_LOG_MAX_BYTES", cfg.log_max_bytes);
    r.unsigned_field("log_backup_count", "AGENT_RELAY_LOG_BACKUP_COUNT", cfg.log_backup_count);
    r.channels_field("channels", "AGENT_RELAY_CHANNELS", cfg.channels);
    r.unsigned_field("io_threads", "AGENT_RELAY_IO_THREADS", cfg.io_threads);
    r.unsigned_field("max_messages_per_channel", "AGENT_RELAY_MAX_MESSAGES", cfg.max_messages_per_channel);
    r.string_field("service_name", "AGENT_RELAY_SERVICE_NAME", cfg.service_name);

    std::string level_text;
    r.string_field("log_level", "AGENT_RELAY_LOG_LEVEL", level_text);
    if (!level_text.empty()) {
        auto level = parse_log_level(level_text);
        if (!level) throw ConfigError("log_level: unknown level '" + level_text + "'");
        cfg.log_level = *level;
    }

    if (cfg.mcp_path.empty() || cfg.mcp_path.front() != '/') cfg.mcp_path = "/" + cfg.mcp_path;
    if (cfg.port == 0) throw ConfigError("port must not be 0");
    return cfg;
}

json config_to_json(const RelayConfig& cfg) {
    static const char* level_names[] = { "debug", "info", "warn", "error" };
    return {
        {"host", cfg.host},
        {"port", cfg.port},
        {"mcp_path", cfg.mcp_path},
        {"log_path", cfg.log_path},
        {"log_level", level_names[static_cast<int>(cfg.log_level)]},
        {"log_max_bytes", cfg.log_max_bytes},
        {"log_backup_count", cfg.log_backup_count},
        {"channels", cfg.channels},
        {"io_threads", static_cast<uint64_t>(cfg.io_threads)},
        {"max_messages_per_channel", static_cast<uint64_t>(cfg.max_messages_per_channel)},
        {"service_name", cfg.service_name}
    };
}
