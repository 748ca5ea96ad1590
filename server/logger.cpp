// logger.cpp
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

std::optional<LogLevel> parse_log_level(const std::string& text) {
    std::string level_string(text);
    for (auto &c: level_string) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (level_string == "debug") return LogLevel::Debug;
    if (level_string == "info") return LogLevel::Info;
    if (level_string == "warn" || level_string == "warning") return LogLevel::Warn;
    if (level_string == "error") return LogLevel::Err;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger()
    : service_name_("agent_relay"),
      log_level_(LogLevel::Info),
      max_log_file_size_(5ull * 1024 * 1024),
      log_rotate_count_(10),
      is_initialized_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_stream_.is_open()) log_file_stream_.close();
}

void Logger::init(const std::string& log_file_path, LogLevel log_level, std::uint64_t max_size_bytes,
                  int rotate_count, const std::string& service_name) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    log_file_path_ = log_file_path;
    log_level_ = log_level;
    max_log_file_size_ = max_size_bytes;
    log_rotate_count_ = std::max(rotate_count, 0);
    service_name_ = service_name;

    fs::path dir = fs::path(log_file_path_).parent_path();
    std::error_code ec;
    if (!dir.empty() && !fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) std::fprintf(stderr, "cannot create log directory %s: %s\n", dir.string().c_str(), ec.message().c_str());
    }

    if (log_file_stream_.is_open()) log_file_stream_.close();
    log_file_stream_.open(log_file_path_, std::ios::app);
    if (!log_file_stream_.is_open())
        std::fprintf(stderr, "cannot open log file %s, logging to stderr\n", log_file_path_.c_str());
    is_initialized_ = true;
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (log_file_stream_.is_open()) log_file_stream_.close();
    is_initialized_ = false;
}

void Logger::set_level(LogLevel log_level) {
    log_level_ = log_level;
}

std::string Logger::level_to_string(LogLevel log_level) const {
    switch (log_level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Err: return "error";
        default: return "info";
    }
}

std::string Logger::timestamp_iso() const {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::time_t current_time = system_clock::to_time_t(now);
    std::tm tm;
    gmtime_r(&current_time, &tm);
    std::ostringstream time_stream;
    time_stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    time_stream << '.' << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return time_stream.str();
}

void Logger::rotate_if_needed_locked() {
    if (!log_file_stream_.is_open()) {
        log_file_stream_.open(log_file_path_, std::ios::app);
        if (!log_file_stream_.is_open()) return;
    }

    std::error_code ec;
    auto sz = fs::file_size(log_file_path_, ec);
    if (ec) return;
    if (sz < max_log_file_size_) return;

    log_file_stream_.close();

    if (log_rotate_count_ == 0) {
        // no backups kept: start the file over
        fs::remove(log_file_path_, ec);
    }
    // file -> file.1, file.1 -> file.2, ... keep log_rotate_count_
    for (int i = log_rotate_count_ - 1; i >= 0; --i) {
        fs::path src = (i == 0) ? fs::path(log_file_path_) : fs::path(log_file_path_ + "." + std::to_string(i));
        fs::path dst = fs::path(log_file_path_ + "." + std::to_string(i + 1));
        if (fs::exists(src, ec)) {
            if (fs::exists(dst, ec)) fs::remove(dst, ec);
            fs::rename(src, dst, ec);
            if (ec) std::fprintf(stderr, "log rotation failed for %s: %s\n", src.string().c_str(), ec.message().c_str());
        }
    }

    log_file_stream_.open(log_file_path_, std::ios::app);
}

void Logger::log(LogLevel log_level, const std::string& log_message, const nlohmann::json& extra) {
    if (static_cast<int>(log_level) < static_cast<int>(log_level_.load())) return;

    nlohmann::json log_entry;
    log_entry["timestamp"] = timestamp_iso();
    log_entry["log_level"] = level_to_string(log_level);
    log_entry["thread_id"] = std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    log_entry["log_message"] = log_message;
    if (!extra.is_null()) log_entry["extra"] = extra;

    std::lock_guard<std::mutex> lock(file_mutex_);
    log_entry["service"] = service_name_;
    // sender and channel names come off the wire; never throw on bad UTF-8
    std::string line = log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    if (is_initialized_) rotate_if_needed_locked();
    if (is_initialized_ && log_file_stream_.is_open()) {
        log_file_stream_ << line << "\n";
        log_file_stream_.flush();
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

void Logger::debug(const std::string& log_message, const nlohmann::json& extra) { log(LogLevel::Debug, log_message, extra); }
void Logger::info(const std::string& log_message, const nlohmann::json& extra)  { log(LogLevel::Info,  log_message, extra); }
void Logger::warn(const std::string& log_message, const nlohmann::json& extra)  { log(LogLevel::Warn,  log_message, extra); }
void Logger::error(const std::string& log_message, const nlohmann::json& extra) { log(LogLevel::Err, log_message, extra); }
