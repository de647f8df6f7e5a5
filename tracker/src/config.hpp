#pragma once

#include <string>
#include <cstdlib>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "logging.hpp"

struct Config {
    static constexpr int MAX_RETRIES_LIMIT = 20;

    // Instrument and signal
    std::string ticker = "BTC-USD";
    int sma_period = 10;
    int check_interval = 60;              // seconds
    double price_drop_threshold = 2.0;    // percent
    int alert_window_minutes = 60;
    int alert_cooldown_seconds = 300;

    // Fetch
    int max_retries = 3;
    int retry_base_delay_ms = 1000;
    int retry_max_delay_ms = 16000;
    int request_timeout_ms = 10000;
    std::string quote_api_base = "https://query1.finance.yahoo.com";

    // Alerts
    std::string telegram_bot_token;
    std::string telegram_chat_id;
    bool use_system_beep = true;

    // Persistence
    int checkpoint_interval = 10;         // cycles
    int history_slack_minutes = 10;
    std::string session_dir = ".";
    std::string session_file;             // empty: <session_dir>/<ticker>_session.json
    std::string export_dir = ".";

    // Service
    int run_duration_seconds = 0;         // 0 runs until stopped
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8085;
    std::string service_name = "price_tracker";
    std::string log_level = "info";
    std::string log_file = "price_tracker.log";

    // Defaults, then the JSON file (if present), then environment variables
    static Config load(const std::string& path);
    static Config from_env();

    void apply_json(const nlohmann::json& j);
    void apply_env();
    void validate() const;

    bool telegram_enabled() const { return !telegram_bot_token.empty(); }
    LogSettings log_settings() const { return {log_level, log_file}; }
    std::string resolved_session_file() const;
    int64_t history_retention_ms() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
