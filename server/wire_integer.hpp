// wire_integer.hpp
#pragma once
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Counts and ids arriving from clients. Negative values clamp to 0 and values
// past uint64 saturate to its maximum; nullopt means "not an integer".

inline std::optional<uint64_t> parse_saturating_uint(const std::string& text) {
    constexpr uint64_t max_value = std::numeric_limits<uint64_t>::max();
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (pos == text.size()) return std::nullopt;

    uint64_t value = 0;
    bool saturated = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (!saturated && value > (max_value - digit) / 10) saturated = true;
        if (!saturated) value = value * 10 + digit;
    }
    if (negative) return 0;
    return saturated ? max_value : value;
}

inline std::optional<uint64_t> json_saturating_uint(const nlohmann::json& v) {
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) return 0; // signed integers only show up when negative
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isnan(d) || std::floor(d) != d) return std::nullopt;
        if (d <= 0) return 0;
        if (d >= 0x1p64) return std::numeric_limits<uint64_t>::max();
        return static_cast<uint64_t>(d);
    }
    if (v.is_string()) return parse_saturating_uint(v.get<std::string>());
    return std::nullopt;
}
