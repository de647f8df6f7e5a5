#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

namespace {

std::tm utc_tm(int64_t timestamp_ms) {
    int64_t secs = timestamp_ms / 1000;
    if (timestamp_ms % 1000 < 0) secs -= 1;
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&itt, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string to_iso8601_ms(int64_t timestamp_ms) {
    std::tm tm = utc_tm(timestamp_ms);
    int64_t millis = timestamp_ms % 1000;
    if (millis < 0) millis += 1000;

    std::ostringstream ss;
    ss << std::put_time(&tm, "%FT%T")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::optional<int64_t> parse_iso8601_ms(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(trim(text));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    const auto eof = std::char_traits<char>::eof();
    int64_t millis = 0;

    if (ss.peek() == '.') {
        ss.get();
        std::string frac;
        while (ss.peek() != eof && std::isdigit(ss.peek())) {
            frac += static_cast<char>(ss.get());
        }
        if (frac.empty()) {
            return std::nullopt;
        }
        // Sub-millisecond digits are truncated
        frac = (frac + "00").substr(0, 3);
        millis = std::stoll(frac);
    }

    if (ss.peek() == 'Z') {
        ss.get();
    }
    if (ss.peek() != eof) {
        return std::nullopt;
    }

    std::time_t secs = timegm(&tm);
    return static_cast<int64_t>(secs) * 1000 + millis;
}

std::string compact_timestamp(int64_t timestamp_ms) {
    std::tm tm = utc_tm(timestamp_ms);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return ss.str();
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

} // namespace util
