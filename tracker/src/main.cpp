#include "config.hpp"
#include "yahoo_client.hpp"
#include "telegram_client.hpp"
#include "audio_cue.hpp"
#include "retrying_fetcher.hpp"
#include "session_store.hpp"
#include "csv_exporter.hpp"
#include "health.hpp"
#include "stop_signal.hpp"
#include "tracker_loop.hpp"
#include "util.hpp"
#include "logging.hpp"
#include <httplib.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <signal.h>
#include <iostream>
#include <memory>
#include <thread>

StopSignal* g_stop = nullptr;
TrackerLoop* g_loop = nullptr;

void signal_handler(int signal) {
    if (signal == SIGUSR1) {
        if (g_loop) g_loop->request_export();
        return;
    }
    if (g_stop) g_stop->request_stop_from_signal();
}

int main() {
    try {
        // Up before the config file is read, so its warnings reach the log file
        LogSettings log_settings = log_settings_from_env();
        setup_logging(log_settings);
        
        Config config = Config::from_env();
        if (config.log_settings() != log_settings) {
            setup_logging(config.log_settings());
        }
        
        spdlog::info("{}", std::string(70, '='));
        spdlog::info("Price Tracker Configuration");
        spdlog::info("{}", std::string(70, '='));
        
        config.validate();
        
        curl_global_init(CURL_GLOBAL_DEFAULT);
        
        StopSignal stop;
        g_stop = &stop;
        
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        signal(SIGUSR1, signal_handler);
        
        // Initialize components
        YahooChartClient quotes(config.quote_api_base, config.request_timeout_ms);
        
        RetryPolicy policy;
        policy.max_retries = config.max_retries;
        policy.base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
        policy.max_delay = std::chrono::milliseconds(config.retry_max_delay_ms);
        
        auto sleeper = [&stop](std::chrono::milliseconds d) { return stop.wait_for(d); };
        RetryingFetcher fetcher(quotes, policy, sleeper);
        
        std::unique_ptr<TelegramClient> telegram;
        if (config.telegram_enabled()) {
            try {
                telegram = std::make_unique<TelegramClient>(config.telegram_bot_token,
                                                            config.telegram_chat_id);
                spdlog::info("Telegram bot initialized for chat ID: {}", config.telegram_chat_id);
            } catch (const std::exception& e) {
                spdlog::warn("Failed to initialize Telegram bot: {}", e.what());
            }
        }
        
        TerminalBell bell(std::cout);
        SessionStore store(config.resolved_session_file(), config.ticker);
        CsvExporter exporter(config.export_dir, config.ticker, static_cast<size_t>(config.sma_period));
        HealthCheck health(config.service_name, config.ticker, config.check_interval,
                           util::current_timestamp_ms());
        
        TrackerLoop loop(config, fetcher, store, exporter, telegram.get(), &bell, &health,
                         stop, util::current_timestamp_ms, sleeper);
        g_loop = &loop;
        
        // Setup HTTP server for /health and on-demand export
        httplib::Server http_server;
        
        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            auto now = util::current_timestamp_ms();
            res.set_content(health.get_status(now).dump(), "application/json");
            res.status = health.is_healthy(now) ? 200 : 503;
        });
        
        http_server.Post("/export", [&loop](const httplib::Request&, httplib::Response& res) {
            loop.request_export();
            res.set_content(R"({"ok":true,"queued":true})", "application/json");
            res.status = 202;
        });
        
        // Bind before the loop starts so stop() below cannot race the listener
        std::thread http_thread;
        if (http_server.bind_to_port(config.listen_addr.c_str(), config.listen_port)) {
            http_thread = std::thread([&http_server, &config]() {
                spdlog::info("HTTP server listening on {}:{}", config.listen_addr, config.listen_port);
                http_server.listen_after_bind();
            });
        } else {
            spdlog::warn("Could not bind HTTP server to {}:{}, /health disabled",
                         config.listen_addr, config.listen_port);
        }
        
        loop.run();
        
        // Graceful shutdown
        spdlog::info("Shutting down gracefully");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }
        
        g_loop = nullptr;
        g_stop = nullptr;
        curl_global_cleanup();
        
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
