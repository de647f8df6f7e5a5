#include "formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>

AlertFormatter::AlertFormatter(std::string ticker) : ticker_(std::move(ticker)) {}

std::string AlertFormatter::window_label(int window_minutes) {
    if (window_minutes % 60 == 0) {
        return fmt::format("{}h", window_minutes / 60);
    }
    return fmt::format("{}m", window_minutes);
}

std::string AlertFormatter::format_drop_alert(const WindowDrop& drop, double threshold_pct,
                                              int window_minutes, int64_t now_ms) const {
    std::string msg = fmt::format("🚨 PRICE DROP ALERT - {}\n", ticker_);
    msg += fmt::format("Drop detected: {:.2f}% (threshold: -{:.2f}%)\n", drop.pct_change, threshold_pct);
    msg += fmt::format("Baseline: ${:.2f} at {}\n", drop.baseline,
                       util::to_iso8601_ms(drop.baseline_ts_ms).substr(0, 19));
    msg += fmt::format("Current: ${:.2f}\n", drop.current);
    msg += fmt::format("Window: Last {} minutes ({} samples)\n", window_minutes, drop.points_in_window);
    msg += fmt::format("Time: {} UTC", util::to_iso8601_ms(now_ms).substr(0, 19));
    return msg;
}

std::string AlertFormatter::format_status(double price, const std::optional<double>& sma,
                                          const std::optional<WindowDrop>& drop,
                                          int window_minutes, size_t records) const {
    std::string sma_str = sma ? fmt::format("SMA: ${:.2f}", *sma) : "SMA: --";
    std::string change_str = drop ? fmt::format("{}: {:+.2f}%", window_label(window_minutes), drop->pct_change)
                                  : fmt::format("{}: --", window_label(window_minutes));

    return fmt::format("{} Price: ${:.2f} | {} | {} | Records: {}",
                       ticker_, price, sma_str, change_str, records);
}
