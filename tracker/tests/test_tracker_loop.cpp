#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/tracker_loop.hpp"
#include "../src/errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <deque>
#include <filesystem>
#include <memory>
#include <random>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int64_t T0 = 1700000000000;
constexpr int64_t MINUTE = 60 * 1000;

// Empty optionals throw QuoteError; once the script runs out the last price repeats
class FakeSource : public QuoteSource {
public:
    Quote get_quote(const std::string& ticker) override {
        calls++;
        if (on_fetch) on_fetch(calls);

        std::optional<double> next = last_;
        if (!script.empty()) {
            next = script.front();
            script.pop_front();
        }
        if (!next) {
            throw QuoteError("HTTP error: 503");
        }
        last_ = next;
        return Quote{ticker, *next, T0};
    }

    std::deque<std::optional<double>> script;
    std::function<void(int)> on_fetch;
    int calls = 0;

private:
    std::optional<double> last_;
};

class RecordingNotifier : public Notifier {
public:
    bool send(const std::string& message) override {
        messages.push_back(message);
        return !fail;
    }
    std::string name() const override { return "recording"; }

    std::vector<std::string> messages;
    bool fail = false;
};

class CountingCue : public AudioCue {
public:
    bool play() override {
        plays++;
        return true;
    }
    int plays = 0;
};

// Routes the default logger into a string for the lifetime of the capture
struct LogCapture {
    std::ostringstream out;
    std::shared_ptr<spdlog::logger> previous = spdlog::default_logger();

    LogCapture() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));
    }
    ~LogCapture() {
        spdlog::set_default_logger(previous);
    }

    std::string text() {
        spdlog::default_logger()->flush();
        return out.str();
    }
};

struct LoopFixture {
    fs::path dir;
    Config config;
    FakeSource source;
    RecordingNotifier notifier;
    CountingCue cue;
    StopSignal stop{std::chrono::milliseconds(1)};
    int64_t now = T0;
    bool auto_advance = false;
    bool real_waits = false;            // sleepers block on StopSignal::wait_for
    std::vector<std::thread> raisers;

    std::unique_ptr<RetryingFetcher> fetcher;
    std::unique_ptr<SessionStore> store;
    std::unique_ptr<CsvExporter> exporter;
    std::unique_ptr<HealthCheck> health;
    std::unique_ptr<TrackerLoop> loop;

    LoopFixture() {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("pricewatch_loop_" + std::to_string(rd()));
        fs::create_directories(dir);

        config.ticker = "BTC-USD";
        config.sma_period = 10;
        config.check_interval = 60;
        config.price_drop_threshold = 2.0;
        config.alert_window_minutes = 60;
        config.alert_cooldown_seconds = 300;
        config.checkpoint_interval = 10;
        config.session_file = (dir / "BTC-USD_session.json").string();
        config.export_dir = (dir / "exports").string();
    }

    ~LoopFixture() {
        for (auto& t : raisers) {
            if (t.joinable()) t.join();
        }
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    RetryingFetcher::Sleeper sleeper() {
        if (real_waits) {
            return [this](std::chrono::milliseconds d) { return stop.wait_for(d); };
        }
        return [](std::chrono::milliseconds) { return true; };
    }

    // Raises the stop from another thread, the way a signal handler would
    void stop_after(std::chrono::milliseconds delay) {
        raisers.emplace_back([this, delay]() {
            std::this_thread::sleep_for(delay);
            stop.request_stop_from_signal();
        });
    }

    TrackerLoop& build() {
        fetcher = std::make_unique<RetryingFetcher>(source, RetryPolicy{}, sleeper());
        store = std::make_unique<SessionStore>(config.resolved_session_file(), config.ticker);
        exporter = std::make_unique<CsvExporter>(config.export_dir, config.ticker,
                                                 static_cast<size_t>(config.sma_period));
        health = std::make_unique<HealthCheck>(config.service_name, config.ticker,
                                               config.check_interval, T0);
        loop = std::make_unique<TrackerLoop>(
            config, *fetcher, *store, *exporter, &notifier, &cue, health.get(), stop,
            [this]() {
                if (auto_advance) now += MINUTE;
                return now;
            },
            sleeper());
        return *loop;
    }

    CycleReport next_cycle() {
        now += MINUTE;
        return loop->run_cycle();
    }

    size_t export_count() const {
        fs::path export_dir(config.export_dir);
        if (!fs::exists(export_dir)) return 0;
        size_t n = 0;
        for (const auto& entry : fs::directory_iterator(export_dir)) {
            if (entry.path().extension() == ".csv") n++;
        }
        return n;
    }
};

} // namespace

TEST_CASE("Tracker loop detects a drop and alerts once", "[tracker_loop]") {
    LoopFixture f;
    for (int i = 0; i < 9; i++) f.source.script.push_back(100.0);
    f.source.script.push_back(95.0);
    f.source.script.push_back(95.0);
    auto& loop = f.build();
    
    for (int i = 0; i < 9; i++) {
        auto report = f.next_cycle();
        REQUIRE(report.recorded);
        REQUIRE_FALSE(report.sma.has_value());
        REQUIRE_FALSE(report.decision.fire);
        REQUIRE_FALSE(report.checkpointed);
    }
    
    auto report = f.next_cycle();
    REQUIRE(report.sma.has_value());
    REQUIRE(*report.sma == Catch::Approx(99.5));
    REQUIRE(report.drop.has_value());
    REQUIRE(report.drop->pct_change == Catch::Approx(-5.0));
    REQUIRE(report.decision.fire);
    REQUIRE(f.notifier.messages.size() == 1);
    REQUIRE(f.notifier.messages[0].find("PRICE DROP ALERT - BTC-USD") != std::string::npos);
    REQUIRE(f.notifier.messages[0].find("-5.00%") != std::string::npos);
    REQUIRE(f.cue.plays == 1);
    
    SECTION("Checkpoint lands on the tenth check") {
        REQUIRE(report.checkpointed);
        REQUIRE(loop.state().checkpoint_seq == 1);
        
        auto saved = f.store->load();
        REQUIRE(saved.has_value());
        REQUIRE(saved->prices.size() == 10);
        REQUIRE(saved->last_alert_ms == f.now);
        REQUIRE(saved->checkpoint_seq == 1);
    }
    
    SECTION("Repeat drop inside the cooldown is throttled") {
        auto repeat = f.next_cycle();
        REQUIRE(repeat.recorded);
        REQUIRE_FALSE(repeat.decision.fire);
        REQUIRE(repeat.decision.reason == AlertReason::Throttled);
        REQUIRE(f.notifier.messages.size() == 1);
        REQUIRE(loop.state().alerts_fired == 1);
    }
    
    SECTION("Health reflects the loop counters") {
        auto status = f.health->snapshot();
        REQUIRE(status.checks == 10);
        REQUIRE(status.alerts == 1);
        REQUIRE(status.records == 10);
        REQUIRE(status.alert_state == "cooling_down");
        REQUIRE(f.health->is_healthy(f.now));
    }
}

TEST_CASE("Tracker loop skips cycles it cannot complete", "[tracker_loop]") {
    LoopFixture f;
    
    SECTION("Exhausted fetch leaves history untouched") {
        f.source.script = {100.0, std::nullopt, std::nullopt, std::nullopt, std::nullopt, 101.0};
        auto& loop = f.build();
        
        REQUIRE(f.next_cycle().recorded);
        
        auto failed = f.next_cycle();
        REQUIRE_FALSE(failed.fetched);
        REQUIRE_FALSE(failed.recorded);
        REQUIRE(failed.error == "HTTP error: 503");
        REQUIRE(loop.state().history.size() == 1);
        REQUIRE(loop.state().skipped_cycles == 1);
        REQUIRE(loop.state().checks == 1);
        
        auto recovered = f.next_cycle();
        REQUIRE(recovered.recorded);
        REQUIRE(loop.state().history.size() == 2);
    }
    
    SECTION("Clock that does not advance rejects the second point") {
        f.source.script = {100.0, 101.0};
        auto& loop = f.build();
        
        REQUIRE(f.next_cycle().recorded);
        auto report = loop.run_cycle();
        REQUIRE(report.fetched);
        REQUIRE_FALSE(report.recorded);
        REQUIRE_FALSE(report.error.empty());
        REQUIRE(loop.state().history.size() == 1);
        REQUIRE(loop.state().history.latest()->price == 100.0);
    }
}

TEST_CASE("Failed notification still starts the cooldown", "[tracker_loop]") {
    LoopFixture f;
    f.notifier.fail = true;
    f.config.sma_period = 2;
    f.source.script = {100.0, 100.0, 90.0, 89.0};
    auto& loop = f.build();
    
    f.next_cycle();
    f.next_cycle();
    auto report = f.next_cycle();
    
    REQUIRE(report.decision.fire);
    REQUIRE(loop.state().notify_failures == 1);
    REQUIRE(loop.state().alerts.last_alert_time() == f.now);
    
    auto repeat = f.next_cycle();
    REQUIRE(repeat.decision.reason == AlertReason::Throttled);
    REQUIRE(f.notifier.messages.size() == 1);
}

TEST_CASE("System beep can be disabled", "[tracker_loop]") {
    LoopFixture f;
    f.config.use_system_beep = false;
    f.source.script = {100.0, 90.0};
    f.build();
    
    f.next_cycle();
    REQUIRE(f.next_cycle().decision.fire);
    REQUIRE(f.cue.plays == 0);
    REQUIRE(f.notifier.messages.size() == 1);
}

TEST_CASE("Tracker loop restores a stored session", "[tracker_loop]") {
    LoopFixture f;
    f.source.script = {100.0};
    auto& loop = f.build();
    
    SessionSnapshot stored;
    stored.ticker = "BTC-USD";
    stored.prices = {{T0 - 3 * MINUTE, 50.0}, {T0 - 2 * MINUTE, 51.0}, {T0 - MINUTE, 52.0}};
    stored.last_alert_ms = T0 - 2 * MINUTE;
    stored.checkpoint_seq = 4;
    
    SECTION("State is replaced, not merged") {
        f.next_cycle();
        REQUIRE(loop.state().history.size() == 1);
        
        REQUIRE(f.store->save(stored));
        REQUIRE(loop.restore());
        
        REQUIRE(loop.state().history.export_points() == stored.prices);
        REQUIRE(loop.state().alerts.last_alert_time() == stored.last_alert_ms);
        REQUIRE(loop.state().checkpoint_seq == 4);
    }
    
    SECTION("Next checkpoint continues the sequence") {
        REQUIRE(f.store->save(stored));
        REQUIRE(loop.restore());
        
        REQUIRE(loop.checkpoint());
        REQUIRE(f.store->load()->checkpoint_seq == 5);
    }
    
    SECTION("Snapshot for another instrument is ignored") {
        stored.ticker = "ETH-USD";
        SessionStore other(f.config.resolved_session_file(), "ETH-USD");
        REQUIRE(other.save(stored));
        
        REQUIRE_FALSE(loop.restore());
        REQUIRE(loop.state().history.empty());
        REQUIRE(loop.state().checkpoint_seq == 0);
    }
}

TEST_CASE("Export request is honored at the end of a cycle", "[tracker_loop]") {
    LoopFixture f;
    f.source.script = {100.0, 101.0};
    auto& loop = f.build();
    
    REQUIRE_FALSE(f.next_cycle().exported);
    
    loop.request_export();
    auto report = f.next_cycle();
    REQUIRE(report.exported);
    REQUIRE(f.export_count() == 1);
}

TEST_CASE("Run stops on request and shuts down cleanly", "[tracker_loop]") {
    LoopFixture f;
    f.auto_advance = true;
    f.source.script = {100.0, 101.0, 102.0};
    f.source.on_fetch = [&f](int calls) {
        if (calls == 3) f.stop.request_stop();
    };
    auto& loop = f.build();
    
    loop.run();
    
    REQUIRE(loop.state().checks == 3);
    REQUIRE(loop.phase() == CyclePhase::Stopped);
    
    auto saved = f.store->load();
    REQUIRE(saved.has_value());
    REQUIRE(saved->prices.size() == 3);
    REQUIRE(saved->checkpoint_seq == 1);
    REQUIRE(f.export_count() == 1);
    
    REQUIRE(f.health->snapshot().phase == "stopped");
    REQUIRE_FALSE(f.health->is_healthy(f.now));
    
    SECTION("Shutdown is idempotent") {
        loop.shutdown();
        REQUIRE(f.store->load()->checkpoint_seq == 1);
    }
}

TEST_CASE("Run honors the duration limit", "[tracker_loop]") {
    LoopFixture f;
    f.auto_advance = true;
    f.config.run_duration_seconds = 600;
    f.source.script = {100.0};
    auto& loop = f.build();
    
    loop.run();
    
    REQUIRE(loop.phase() == CyclePhase::Stopped);
    REQUIRE(loop.state().checks >= 1);
    REQUIRE(loop.state().checks <= 10);
    REQUIRE(f.stop.stop_requested() == false);
}

TEST_CASE("Stop during a backoff wait ends the run", "[tracker_loop]") {
    LoopFixture f;
    f.real_waits = true;
    f.auto_advance = true;
    f.source.script = {std::nullopt, std::nullopt, std::nullopt, std::nullopt};
    f.source.on_fetch = [&f](int calls) {
        if (calls == 1) f.stop_after(std::chrono::milliseconds(50));
    };
    auto& loop = f.build();
    
    SessionSnapshot stored;
    stored.ticker = "BTC-USD";
    stored.prices = {{T0 - 2 * MINUTE, 100.0}, {T0 - MINUTE, 101.0}};
    stored.checkpoint_seq = 3;
    REQUIRE(f.store->save(stored));
    
    auto start = std::chrono::steady_clock::now();
    loop.run();
    auto waited = std::chrono::steady_clock::now() - start;
    
    // First backoff is 1s; the stop cuts it short and no second attempt is made
    REQUIRE(f.source.calls == 1);
    REQUIRE(waited < std::chrono::seconds(1));
    REQUIRE(loop.phase() == CyclePhase::Stopped);
    REQUIRE(loop.state().skipped_cycles == 1);
    REQUIRE(loop.state().checks == 0);
    REQUIRE(loop.state().history.export_points() == stored.prices);
    
    auto saved = f.store->load();
    REQUIRE(saved.has_value());
    REQUIRE(saved->prices == stored.prices);
    REQUIRE(saved->checkpoint_seq == 4);
}

TEST_CASE("Stop during the idle wait ends the run", "[tracker_loop]") {
    LoopFixture f;
    f.real_waits = true;
    f.auto_advance = true;
    f.source.script = {100.0};
    auto& loop = f.build();
    
    f.stop_after(std::chrono::milliseconds(100));
    auto start = std::chrono::steady_clock::now();
    loop.run();
    auto waited = std::chrono::steady_clock::now() - start;
    
    // check_interval is 60s, the run must not sit out the interval
    REQUIRE(waited < std::chrono::seconds(10));
    REQUIRE(f.source.calls == 1);
    REQUIRE(loop.state().checks == 1);
    REQUIRE(loop.phase() == CyclePhase::Stopped);
    
    auto saved = f.store->load();
    REQUIRE(saved.has_value());
    REQUIRE(saved->prices.size() == 1);
    REQUIRE(saved->checkpoint_seq == 1);
}

TEST_CASE("Cycle cancelled during backoff leaves history untouched", "[tracker_loop]") {
    LoopFixture f;
    f.real_waits = true;
    f.source.script = {100.0, std::nullopt};
    auto& loop = f.build();
    
    REQUIRE(f.next_cycle().recorded);
    
    f.stop.request_stop();
    auto report = f.next_cycle();
    REQUIRE_FALSE(report.fetched);
    REQUIRE(report.error == "cancelled");
    REQUIRE(f.source.calls == 2);
    REQUIRE(loop.state().skipped_cycles == 1);
    REQUIRE(loop.state().history.size() == 1);
    REQUIRE(loop.state().history.latest()->price == 100.0);
}

TEST_CASE("Restore warns when stored history is ahead of the clock", "[tracker_loop]") {
    LoopFixture f;
    f.source.script = {100.0};
    auto& loop = f.build();
    
    SessionSnapshot stored;
    stored.ticker = "BTC-USD";
    stored.prices = {{T0 + 5 * MINUTE, 50.0}, {T0 + 10 * MINUTE, 51.0}};
    REQUIRE(f.store->save(stored));
    
    SECTION("Clock behind the newest point") {
        LogCapture capture;
        REQUIRE(loop.restore());
        REQUIRE(capture.text().find("ahead of the local clock") != std::string::npos);
        
        // Cycles are skipped, not fatal, until the clock passes the stored point
        auto report = f.next_cycle();
        REQUIRE(report.fetched);
        REQUIRE_FALSE(report.recorded);
        REQUIRE(loop.state().history.size() == 2);
    }
    
    SECTION("Clock past the newest point") {
        f.now = T0 + 20 * MINUTE;
        LogCapture capture;
        REQUIRE(loop.restore());
        REQUIRE(capture.text().find("ahead of the local clock") == std::string::npos);
        REQUIRE(f.next_cycle().recorded);
    }
}
