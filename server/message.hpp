// message.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

struct Message {
    uint64_t id;
    std::string channel;
    std::string sender;
    std::string text; // opaque, may be empty or multi-line
    std::chrono::system_clock::time_point created_at;
};

// seconds since the epoch with sub-second precision
inline double epoch_seconds(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<duration<double>>(tp.time_since_epoch()).count();
}

inline nlohmann::json message_to_json(const Message& m) {
    return {
        {"id", m.id},
        {"channel", m.channel},
        {"sender", m.sender},
        {"text", m.text},
        {"created_at", epoch_seconds(m.created_at)}
    };
}
