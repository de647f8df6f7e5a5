#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::string service, std::string ticker, int check_interval_sec, int64_t started_ms)
    : service_(std::move(service))
    , ticker_(std::move(ticker))
    , stale_after_ms_(static_cast<int64_t>(check_interval_sec) * 3 * 1000)
    , started_ms_(started_ms)
{}

void HealthCheck::publish(const TrackerStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
}

void HealthCheck::set_phase(const std::string& phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_.phase = phase;
}

TrackerStatus HealthCheck::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool HealthCheck::healthy_locked(int64_t now_ms) const {
    if (status_.phase == "stopped") {
        return false;
    }
    if (status_.last_success_ms > 0) {
        return now_ms - status_.last_success_ms <= stale_after_ms_;
    }
    return now_ms - started_ms_ <= stale_after_ms_;
}

bool HealthCheck::is_healthy(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return healthy_locked(now_ms);
}

nlohmann::json HealthCheck::get_status(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto opt = [](const std::optional<double>& v) {
        return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    };
    auto ts = [](int64_t ms) {
        return ms > 0 ? nlohmann::json(util::to_iso8601_ms(ms)) : nlohmann::json(nullptr);
    };

    return {
        {"ok", healthy_locked(now_ms)},
        {"service", service_},
        {"ticker", ticker_},
        {"phase", status_.phase},
        {"alert_state", status_.alert_state},
        {"checks", status_.checks},
        {"alerts", status_.alerts},
        {"fetch_failures", status_.fetch_failures},
        {"skipped_cycles", status_.skipped_cycles},
        {"records", status_.records},
        {"last_price", opt(status_.last_price)},
        {"sma", opt(status_.sma)},
        {"window_change_pct", opt(status_.window_change_pct)},
        {"last_success_ts", ts(status_.last_success_ms)},
        {"last_cycle_ts", ts(status_.last_cycle_ms)},
        {"checkpoint_seq", status_.checkpoint_seq}
    };
}
