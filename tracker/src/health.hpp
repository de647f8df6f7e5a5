#pragma once

#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <cstdint>

// Copy of the loop's counters, published once per cycle
struct TrackerStatus {
    std::string phase = "starting";
    std::string alert_state = "armed";
    uint64_t checks = 0;
    uint64_t alerts = 0;
    uint64_t fetch_failures = 0;
    uint64_t skipped_cycles = 0;
    size_t records = 0;
    std::optional<double> last_price;
    std::optional<double> sma;
    std::optional<double> window_change_pct;
    int64_t last_success_ms = 0;
    int64_t last_cycle_ms = 0;
    uint64_t checkpoint_seq = 0;
};

// Read by the HTTP thread, written by the tracker loop. The HTTP side only
// ever sees copies, never the history itself.
class HealthCheck {
public:
    HealthCheck(std::string service, std::string ticker, int check_interval_sec, int64_t started_ms);

    void publish(const TrackerStatus& status);
    void set_phase(const std::string& phase);
    TrackerStatus snapshot() const;

    nlohmann::json get_status(int64_t now_ms) const;
    // Healthy while the last successful fetch is recent (3 intervals),
    // or the service is still within its first 3 intervals
    bool is_healthy(int64_t now_ms) const;

private:
    std::string service_;
    std::string ticker_;
    int64_t stale_after_ms_;
    int64_t started_ms_;

    mutable std::mutex mutex_;
    TrackerStatus status_;

    bool healthy_locked(int64_t now_ms) const;
};
