#include "alert_engine.hpp"
#include <spdlog/spdlog.h>

const char* to_string(AlertState state) {
    switch (state) {
        case AlertState::Armed: return "armed";
        case AlertState::CoolingDown: return "cooling_down";
    }
    return "unknown";
}

const char* to_string(AlertReason reason) {
    switch (reason) {
        case AlertReason::Skipped: return "skipped";
        case AlertReason::NoData: return "no_data";
        case AlertReason::WithinThreshold: return "within_threshold";
        case AlertReason::Throttled: return "throttled";
        case AlertReason::Drop: return "drop";
    }
    return "unknown";
}

AlertEngine::AlertEngine(double threshold_pct, int64_t cooldown_ms)
    : threshold_pct_(threshold_pct)
    , cooldown_ms_(cooldown_ms)
{}

AlertState AlertEngine::state(int64_t now_ms) const {
    if (!last_alert_ms_.has_value()) {
        return AlertState::Armed;
    }
    if (now_ms - *last_alert_ms_ >= cooldown_ms_) {
        return AlertState::Armed;
    }
    return AlertState::CoolingDown;
}

AlertDecision AlertEngine::evaluate(const std::optional<WindowDrop>& drop, int64_t now_ms) {
    if (!drop.has_value()) {
        return {false, AlertReason::NoData};
    }

    // Only drops count, a rise of the same size never fires
    if (drop->pct_change > -threshold_pct_) {
        return {false, AlertReason::WithinThreshold};
    }

    if (state(now_ms) == AlertState::CoolingDown) {
        spdlog::debug("Drop of {:.2f}% throttled, {}s of cooldown left",
                      drop->pct_change, (cooldown_ms_ - (now_ms - *last_alert_ms_)) / 1000);
        return {false, AlertReason::Throttled};
    }

    last_alert_ms_ = now_ms;
    return {true, AlertReason::Drop};
}
