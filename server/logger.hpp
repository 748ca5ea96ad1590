// logger.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Err = 3 };

// "debug", "info", "warn"/"warning", "error" (case-insensitive)
std::optional<LogLevel> parse_log_level(const std::string& text);

// Process-wide JSON-lines log with size based rotation. Until init() is called
// entries go to stderr.
class Logger {
public:
    static Logger& instance();

    void init(const std::string& log_file_path,
              LogLevel log_level = LogLevel::Info,
              std::uint64_t max_size_bytes = 5ull * 1024 * 1024, // 5MB
              int rotate_count = 10,
              const std::string& service_name = "agent_relay");

    // back to stderr; used at shutdown and by tests
    void close();
    void set_level(LogLevel log_level);

    void log(LogLevel log_level, const std::string& log_message, const nlohmann::json& extra = nlohmann::json());

    void debug(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void info(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void warn(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());
    void error(const std::string& log_message, const nlohmann::json& extra = nlohmann::json());

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string level_to_string(LogLevel log_level) const;
    std::string timestamp_iso() const;
    void rotate_if_needed_locked();

    std::mutex file_mutex_;
    std::ofstream log_file_stream_;
    std::string log_file_path_;
    std::string service_name_;
    std::atomic<LogLevel> log_level_;
    std::uint64_t max_log_file_size_;
    int log_rotate_count_;
    bool is_initialized_;
};
