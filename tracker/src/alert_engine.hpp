#pragma once

#include "types.hpp"
#include <optional>
#include <cstdint>

enum class AlertState {
    Armed,
    CoolingDown
};

const char* to_string(AlertState state);

enum class AlertReason {
    Skipped,          // cycle ended before evaluation
    NoData,
    WithinThreshold,
    Throttled,
    Drop
};

const char* to_string(AlertReason reason);

struct AlertDecision {
    bool fire;
    AlertReason reason;
};

class AlertEngine {
public:
    AlertEngine(double threshold_pct, int64_t cooldown_ms);

    // Fires on pct_change <= -threshold while armed and commits the
    // transition to CoolingDown with last_alert_time = now.
    AlertDecision evaluate(const std::optional<WindowDrop>& drop, int64_t now_ms);

    AlertState state(int64_t now_ms) const;
    std::optional<int64_t> last_alert_time() const { return last_alert_ms_; }

    // Restored from a session snapshot, replaces any in-memory state
    void restore(std::optional<int64_t> last_alert_ms) { last_alert_ms_ = last_alert_ms; }

    double threshold_pct() const { return threshold_pct_; }
    int64_t cooldown_ms() const { return cooldown_ms_; }

private:
    double threshold_pct_;
    int64_t cooldown_ms_;
    std::optional<int64_t> last_alert_ms_;
};
