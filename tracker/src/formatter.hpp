#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <cstdint>

class AlertFormatter {
public:
    explicit AlertFormatter(std::string ticker);

    std::string format_drop_alert(const WindowDrop& drop, double threshold_pct,
                                  int window_minutes, int64_t now_ms) const;

    // One line per cycle: "BTC-USD Price: $100.00 | SMA: $99.50 | 1h: -5.00% | Records: 10"
    std::string format_status(double price, const std::optional<double>& sma,
                              const std::optional<WindowDrop>& drop,
                              int window_minutes, size_t records) const;

private:
    std::string ticker_;

    static std::string window_label(int window_minutes);
};
