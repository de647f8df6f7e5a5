#pragma once

#include <string>
#include <cstdint>

struct PricePoint {
    int64_t timestamp_ms;
    double price;

    bool operator==(const PricePoint& other) const {
        return timestamp_ms == other.timestamp_ms && price == other.price;
    }
    bool operator!=(const PricePoint& other) const { return !(*this == other); }
};

struct Quote {
    std::string ticker;
    double price;
    int64_t timestamp_ms;
};

// Change between the earliest in-window point and the latest point
struct WindowDrop {
    double baseline;
    double current;
    double pct_change;
    int64_t baseline_ts_ms;
    int64_t current_ts_ms;
    size_t points_in_window;
};
