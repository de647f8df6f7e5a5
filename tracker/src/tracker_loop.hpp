#pragma once

#include "config.hpp"
#include "price_history.hpp"
#include "alert_engine.hpp"
#include "retrying_fetcher.hpp"
#include "session_store.hpp"
#include "csv_exporter.hpp"
#include "formatter.hpp"
#include "notifier.hpp"
#include "health.hpp"
#include "stop_signal.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <cstdint>

enum class CyclePhase {
    Running,
    Fetching,
    Evaluating,
    Alerting,
    Checkpointing,
    Stopped
};

const char* to_string(CyclePhase phase);

// Everything the loop mutates, owned by the loop and touched only from its thread
struct TrackerState {
    PriceHistory history;
    AlertEngine alerts;
    uint64_t checkpoint_seq = 0;
    uint64_t cycles = 0;
    uint64_t checks = 0;
    uint64_t alerts_fired = 0;
    uint64_t notify_failures = 0;
    uint64_t skipped_cycles = 0;
    uint64_t failed_checkpoints = 0;

    TrackerState(PriceHistory h, AlertEngine a)
        : history(std::move(h)), alerts(std::move(a)) {}
};

struct CycleReport {
    bool fetched = false;
    bool recorded = false;
    std::optional<double> price;
    std::optional<double> sma;
    std::optional<WindowDrop> drop;
    AlertDecision decision{false, AlertReason::Skipped};
    bool checkpointed = false;
    bool exported = false;
    std::string error;
};

class TrackerLoop {
public:
    using Clock = std::function<int64_t()>;
    using Sleeper = RetryingFetcher::Sleeper;

    // notifier, audio_cue and health may be null
    TrackerLoop(const Config& config,
                RetryingFetcher& fetcher,
                SessionStore& store,
                const CsvExporter& exporter,
                Notifier* notifier,
                AudioCue* audio_cue,
                HealthCheck* health,
                StopSignal& stop,
                Clock clock,
                Sleeper idle_sleeper);

    // Replaces in-memory state with the stored session, if any
    bool restore();

    // fetch -> record -> evaluate -> (alert) -> (checkpoint)
    CycleReport run_cycle();

    // Cycles on a fixed cadence until stopped, then shutdown()
    void run();

    // Final checkpoint, summary and export
    void shutdown();

    bool checkpoint();
    std::optional<std::filesystem::path> export_now();

    // Safe from any thread and from signal handlers
    void request_export() { export_requested_.store(true); }

    const TrackerState& state() const { return state_; }
    CyclePhase phase() const { return phase_; }
    SessionSnapshot make_snapshot(uint64_t seq) const;

private:
    const Config& config_;
    RetryingFetcher& fetcher_;
    SessionStore& store_;
    const CsvExporter& exporter_;
    Notifier* notifier_;
    AudioCue* audio_cue_;
    HealthCheck* health_;
    StopSignal& stop_;
    Clock clock_;
    Sleeper idle_sleeper_;

    TrackerState state_;
    AlertFormatter formatter_;
    CyclePhase phase_ = CyclePhase::Running;
    std::atomic<bool> export_requested_{false};
    bool shut_down_ = false;
    int64_t last_success_ms_ = 0;

    void set_phase(CyclePhase phase);
    void dispatch_alert(const WindowDrop& drop, int64_t now_ms);
    void publish_health(const CycleReport& report, int64_t now_ms);
    void log_summary() const;
};
