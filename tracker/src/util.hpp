#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();

    // UTC, millisecond precision: 2024-05-01T12:00:00.250Z
    std::string to_iso8601_ms(int64_t timestamp_ms);
    std::optional<int64_t> parse_iso8601_ms(const std::string& text);

    // 20240501_120000, used in export file names
    std::string compact_timestamp(int64_t timestamp_ms);

    std::string to_lower(std::string str);
    std::string trim(const std::string& str);
}
