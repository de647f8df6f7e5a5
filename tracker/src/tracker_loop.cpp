#include "tracker_loop.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

const char* to_string(CyclePhase phase) {
    switch (phase) {
        case CyclePhase::Running: return "running";
        case CyclePhase::Fetching: return "fetching";
        case CyclePhase::Evaluating: return "evaluating";
        case CyclePhase::Alerting: return "alerting";
        case CyclePhase::Checkpointing: return "checkpointing";
        case CyclePhase::Stopped: return "stopped";
    }
    return "unknown";
}

TrackerLoop::TrackerLoop(const Config& config,
                         RetryingFetcher& fetcher,
                         SessionStore& store,
                         const CsvExporter& exporter,
                         Notifier* notifier,
                         AudioCue* audio_cue,
                         HealthCheck* health,
                         StopSignal& stop,
                         Clock clock,
                         Sleeper idle_sleeper)
    : config_(config)
    , fetcher_(fetcher)
    , store_(store)
    , exporter_(exporter)
    , notifier_(notifier)
    , audio_cue_(audio_cue)
    , health_(health)
    , stop_(stop)
    , clock_(std::move(clock))
    , idle_sleeper_(std::move(idle_sleeper))
    , state_(PriceHistory(config.history_retention_ms(), static_cast<size_t>(config.sma_period)),
             AlertEngine(config.price_drop_threshold,
                         static_cast<int64_t>(config.alert_cooldown_seconds) * 1000))
    , formatter_(config.ticker)
{}

void TrackerLoop::set_phase(CyclePhase phase) {
    phase_ = phase;
    if (health_) {
        health_->set_phase(to_string(phase));
    }
}

bool TrackerLoop::restore() {
    auto snapshot = store_.load();
    if (!snapshot) {
        return false;
    }

    try {
        state_.history.replace(snapshot->prices);
    } catch (const OutOfOrderError& e) {
        spdlog::warn("Stored session rejected ({}), starting fresh", e.what());
        state_.history.clear();
        return false;
    }

    state_.alerts.restore(snapshot->last_alert_ms);
    state_.checkpoint_seq = snapshot->checkpoint_seq;

    if (auto latest = state_.history.latest()) {
        spdlog::info("Resumed {} with {} records, last price ${:.2f} at {}",
                     config_.ticker, state_.history.size(), latest->price,
                     util::to_iso8601_ms(latest->timestamp_ms));

        int64_t now_ms = clock_();
        if (latest->timestamp_ms >= now_ms) {
            spdlog::warn("Stored history ends at {}, {}s ahead of the local clock ({}); "
                         "prices are not recorded until the clock passes it",
                         util::to_iso8601_ms(latest->timestamp_ms),
                         (latest->timestamp_ms - now_ms) / 1000,
                         util::to_iso8601_ms(now_ms));
        }
    }
    if (snapshot->last_alert_ms) {
        spdlog::info("Last alert was sent at {}", util::to_iso8601_ms(*snapshot->last_alert_ms));
    }
    return true;
}

SessionSnapshot TrackerLoop::make_snapshot(uint64_t seq) const {
    SessionSnapshot snapshot;
    snapshot.ticker = config_.ticker;
    snapshot.prices = state_.history.export_points();
    snapshot.last_alert_ms = state_.alerts.last_alert_time();
    snapshot.checkpoint_seq = seq;
    return snapshot;
}

bool TrackerLoop::checkpoint() {
    uint64_t seq = state_.checkpoint_seq + 1;
    if (!store_.save(make_snapshot(seq))) {
        // Retried at the next checkpoint boundary
        state_.failed_checkpoints++;
        return false;
    }
    state_.checkpoint_seq = seq;
    return true;
}

std::optional<std::filesystem::path> TrackerLoop::export_now() {
    return exporter_.export_points(state_.history.export_points(), clock_());
}

void TrackerLoop::dispatch_alert(const WindowDrop& drop, int64_t now_ms) {
    std::string message = formatter_.format_drop_alert(
        drop, config_.price_drop_threshold, config_.alert_window_minutes, now_ms);

    spdlog::warn("\n{}\n", message);
    state_.alerts_fired++;

    if (audio_cue_ && config_.use_system_beep) {
        try {
            if (!audio_cue_->play()) {
                spdlog::warn("Could not trigger beep");
            }
        } catch (const std::exception& e) {
            spdlog::warn("Could not trigger beep: {}", e.what());
        }
    }

    if (notifier_) {
        bool sent = false;
        try {
            sent = notifier_->send(message);
        } catch (const std::exception& e) {
            spdlog::error("{} notifier threw: {}", notifier_->name(), e.what());
        }
        if (!sent) {
            // The cooldown still applies, a flaky transport must not cause alert spam
            state_.notify_failures++;
            spdlog::warn("{} delivery failed, alert counted as sent", notifier_->name());
        }
    }
}

CycleReport TrackerLoop::run_cycle() {
    CycleReport report;
    state_.cycles++;

    // 1. Fetch
    set_phase(CyclePhase::Fetching);
    auto result = fetcher_.fetch(config_.ticker);
    int64_t now_ms = clock_();

    if (!result.ok()) {
        state_.skipped_cycles++;
        report.error = result.cancelled ? "cancelled" : result.last_error;
        if (!result.cancelled) {
            spdlog::warn("Skipping cycle, next check in {}s", config_.check_interval);
        }
        set_phase(CyclePhase::Running);
        publish_health(report, now_ms);
        return report;
    }
    report.fetched = true;
    report.price = result.quote->price;

    // 2. Record
    try {
        state_.history.record(PricePoint{now_ms, result.quote->price});
    } catch (const OutOfOrderError& e) {
        state_.skipped_cycles++;
        report.error = e.what();
        spdlog::error("Price not recorded: {}", e.what());
        set_phase(CyclePhase::Running);
        publish_health(report, now_ms);
        return report;
    }
    report.recorded = true;
    state_.checks++;
    last_success_ms_ = now_ms;

    // 3. Evaluate
    set_phase(CyclePhase::Evaluating);
    report.sma = state_.history.sma(static_cast<size_t>(config_.sma_period));
    report.drop = state_.history.windowed_drop(config_.alert_window_minutes, now_ms);

    spdlog::info("{}", formatter_.format_status(result.quote->price, report.sma, report.drop,
                                          config_.alert_window_minutes, state_.history.size()));

    // 4. Alert
    report.decision = state_.alerts.evaluate(report.drop, now_ms);
    if (report.decision.fire) {
        set_phase(CyclePhase::Alerting);
        dispatch_alert(*report.drop, now_ms);
    } else if (report.decision.reason == AlertReason::Throttled) {
        spdlog::info("Drop of {:.2f}% still beyond threshold, alert throttled", report.drop->pct_change);
    }

    // 5. Checkpoint
    if (state_.checks % static_cast<uint64_t>(config_.checkpoint_interval) == 0) {
        set_phase(CyclePhase::Checkpointing);
        report.checkpointed = checkpoint();
    }

    if (export_requested_.exchange(false)) {
        report.exported = export_now().has_value();
    }

    set_phase(CyclePhase::Running);
    publish_health(report, now_ms);
    return report;
}

void TrackerLoop::run() {
    spdlog::info("Starting price tracker for {}", config_.ticker);
    spdlog::info("   Check interval: {} seconds", config_.check_interval);
    spdlog::info("   SMA period: {}", config_.sma_period);
    spdlog::info("   Alert threshold: {}% drop in {} minutes",
                 config_.price_drop_threshold, config_.alert_window_minutes);

    restore();

    const auto interval = std::chrono::milliseconds(static_cast<int64_t>(config_.check_interval) * 1000);
    const int64_t started_ms = clock_();
    auto next_start = std::chrono::steady_clock::now();

    while (!stop_.stop_requested()) {
        if (config_.run_duration_seconds > 0 &&
            clock_() - started_ms >= static_cast<int64_t>(config_.run_duration_seconds) * 1000) {
            spdlog::info("Duration limit reached ({}s)", config_.run_duration_seconds);
            break;
        }

        try {
            run_cycle();
        } catch (const std::exception& e) {
            spdlog::error("Unexpected error in cycle: {}", e.what());
            set_phase(CyclePhase::Running);
        }

        if (stop_.stop_requested()) {
            break;
        }

        // Cadence is start-to-start; an overrun starts the next cycle immediately
        next_start += interval;
        auto now = std::chrono::steady_clock::now();
        if (next_start < now) {
            spdlog::warn("Cycle overran the {}s interval", config_.check_interval);
            next_start = now;
        }

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_start - now);
        if (!idle_sleeper_(wait)) {
            break;
        }
    }

    shutdown();
}

void TrackerLoop::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    spdlog::info("Tracking stopped");

    set_phase(CyclePhase::Checkpointing);
    checkpoint();

    log_summary();

    if (!state_.history.empty()) {
        export_now();
    }

    set_phase(CyclePhase::Stopped);
    if (health_) {
        auto status = health_->snapshot();
        status.phase = to_string(CyclePhase::Stopped);
        status.checkpoint_seq = state_.checkpoint_seq;
        health_->publish(status);
    }
}

void TrackerLoop::log_summary() const {
    spdlog::info("{}", std::string(70, '-'));
    spdlog::info("Tracking Summary:");
    spdlog::info("   Total checks: {}", state_.checks);
    spdlog::info("   Skipped cycles: {}", state_.skipped_cycles);
    spdlog::info("   Alerts triggered: {}", state_.alerts_fired);
    spdlog::info("   Data points collected: {}", state_.history.size());

    if (auto range = state_.history.price_range()) {
        spdlog::info("   Price range: ${:.2f} - ${:.2f}", range->first, range->second);
    }
}

void TrackerLoop::publish_health(const CycleReport& report, int64_t now_ms) {
    if (!health_) return;

    TrackerStatus status;
    status.phase = to_string(phase_);
    status.alert_state = to_string(state_.alerts.state(now_ms));
    status.checks = state_.checks;
    status.alerts = state_.alerts_fired;
    status.fetch_failures = fetcher_.stats().failures;
    status.skipped_cycles = state_.skipped_cycles;
    status.records = state_.history.size();
    if (auto latest = state_.history.latest()) {
        status.last_price = latest->price;
    }
    status.sma = state_.history.sma(static_cast<size_t>(config_.sma_period));
    if (report.drop) {
        status.window_change_pct = report.drop->pct_change;
    }
    status.last_success_ms = last_success_ms_;
    status.last_cycle_ms = now_ms;
    status.checkpoint_seq = state_.checkpoint_seq;

    health_->publish(status);
}
