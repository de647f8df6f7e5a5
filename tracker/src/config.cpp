#include "config.hpp"
#include "session_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val || !*val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val || !*val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val || !*val) return default_val;
    std::string s = util::to_lower(val);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    spdlog::warn("Invalid boolean for {}, using {}", name, default_val);
    return default_val;
}

namespace {

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        out = j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring config key {}: {}", key, e.what());
    }
}

} // namespace

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        spdlog::warn("Config file root is not an object, ignoring");
        return;
    }

    read_key(j, "ticker", ticker);
    read_key(j, "sma_period", sma_period);
    read_key(j, "check_interval", check_interval);
    read_key(j, "price_drop_threshold", price_drop_threshold);
    read_key(j, "alert_window_minutes", alert_window_minutes);
    read_key(j, "alert_cooldown_seconds", alert_cooldown_seconds);
    read_key(j, "max_retries", max_retries);
    read_key(j, "retry_base_delay_ms", retry_base_delay_ms);
    read_key(j, "retry_max_delay_ms", retry_max_delay_ms);
    read_key(j, "request_timeout_ms", request_timeout_ms);
    read_key(j, "quote_api_base", quote_api_base);
    read_key(j, "telegram_bot_token", telegram_bot_token);
    read_key(j, "use_system_beep", use_system_beep);
    read_key(j, "checkpoint_interval", checkpoint_interval);
    read_key(j, "history_slack_minutes", history_slack_minutes);
    read_key(j, "session_dir", session_dir);
    read_key(j, "session_file", session_file);
    read_key(j, "export_dir", export_dir);
    read_key(j, "run_duration_seconds", run_duration_seconds);
    read_key(j, "listen_addr", listen_addr);
    read_key(j, "listen_port", listen_port);
    read_key(j, "log_level", log_level);
    read_key(j, "log_file", log_file);

    // Chat ids are often written as numbers
    if (j.contains("telegram_chat_id") && j["telegram_chat_id"].is_number_integer()) {
        telegram_chat_id = std::to_string(j["telegram_chat_id"].get<int64_t>());
    } else {
        read_key(j, "telegram_chat_id", telegram_chat_id);
    }
}

void Config::apply_env() {
    ticker = get_env("TRACKER_TICKER", ticker);
    sma_period = get_env_int("TRACKER_SMA_PERIOD", sma_period);
    check_interval = get_env_int("TRACKER_CHECK_INTERVAL", check_interval);
    price_drop_threshold = get_env_double("TRACKER_THRESHOLD", price_drop_threshold);
    alert_window_minutes = get_env_int("TRACKER_ALERT_WINDOW_MINUTES", alert_window_minutes);
    alert_cooldown_seconds = get_env_int("TRACKER_ALERT_COOLDOWN_SECONDS", alert_cooldown_seconds);
    max_retries = get_env_int("TRACKER_MAX_RETRIES", max_retries);
    use_system_beep = get_env_bool("TRACKER_SYSTEM_BEEP", use_system_beep);
    checkpoint_interval = get_env_int("TRACKER_CHECKPOINT_INTERVAL", checkpoint_interval);
    
    telegram_bot_token = get_env("TELEGRAM_BOT_TOKEN", telegram_bot_token);
    telegram_chat_id = get_env("TELEGRAM_CHAT_ID", telegram_chat_id);
    
    quote_api_base = get_env("QUOTE_API_BASE", quote_api_base);
    request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", request_timeout_ms);
    session_dir = get_env("SESSION_DIR", session_dir);
    session_file = get_env("SESSION_FILE", session_file);
    export_dir = get_env("EXPORT_DIR", export_dir);
    run_duration_seconds = get_env_int("RUN_DURATION_SECONDS", run_duration_seconds);
    
    listen_addr = get_env("LISTEN_ADDR", listen_addr);
    listen_port = get_env_int("LISTEN_PORT", listen_port);
    service_name = get_env("SERVICE_NAME", service_name);
    log_level = get_env("LOG_LEVEL", log_level);
    log_file = get_env("LOG_FILE", log_file);
}

Config Config::load(const std::string& path) {
    Config cfg;
    
    if (!path.empty() && std::filesystem::exists(path)) {
        try {
            std::ifstream in(path);
            cfg.apply_json(nlohmann::json::parse(in));
            spdlog::info("Loaded config from {}", path);
        } catch (const std::exception& e) {
            spdlog::warn("Could not load config file {}: {}", path, e.what());
        }
    }
    
    cfg.apply_env();
    return cfg;
}

Config Config::from_env() {
    return load(get_env("TRACKER_CONFIG", "price_tracker_config.json"));
}

std::string Config::resolved_session_file() const {
    if (!session_file.empty()) return session_file;
    return SessionStore::default_path(session_dir, ticker).string();
}

int64_t Config::history_retention_ms() const {
    int64_t window_ms = static_cast<int64_t>(alert_window_minutes) * 60 * 1000;
    int64_t sma_span_ms = static_cast<int64_t>(sma_period) * check_interval * 1000;
    int64_t slack_ms = static_cast<int64_t>(std::max(history_slack_minutes, 0)) * 60 * 1000;
    return std::max(window_ms, sma_span_ms) + slack_ms;
}

void Config::validate() const {
    if (util::trim(ticker).empty()) {
        throw std::runtime_error("ticker is required");
    }
    if (sma_period <= 0) {
        throw std::runtime_error("sma_period must be positive");
    }
    if (check_interval <= 0) {
        throw std::runtime_error("check_interval must be positive");
    }
    if (price_drop_threshold <= 0) {
        throw std::runtime_error("price_drop_threshold must be positive");
    }
    if (alert_window_minutes <= 0) {
        throw std::runtime_error("alert_window_minutes must be positive");
    }
    if (alert_cooldown_seconds < 0) {
        throw std::runtime_error("alert_cooldown_seconds must not be negative");
    }
    if (max_retries < 0 || max_retries > MAX_RETRIES_LIMIT) {
        throw std::runtime_error("max_retries must be between 0 and " + std::to_string(MAX_RETRIES_LIMIT));
    }
    if (retry_base_delay_ms < 0 || retry_max_delay_ms < retry_base_delay_ms) {
        throw std::runtime_error("retry delays must satisfy 0 <= base <= max");
    }
    if (checkpoint_interval <= 0) {
        throw std::runtime_error("checkpoint_interval must be positive");
    }
    if (telegram_enabled() && telegram_chat_id.empty()) {
        throw std::runtime_error("TELEGRAM_CHAT_ID is required when TELEGRAM_BOT_TOKEN is set");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Ticker: {}", ticker);
    spdlog::info("  Check interval: {}s, SMA period: {}", check_interval, sma_period);
    spdlog::info("  Alert threshold: {}% drop in {} minutes (cooldown {}s)",
                 price_drop_threshold, alert_window_minutes, alert_cooldown_seconds);
    spdlog::info("  System beep alerts: {}", use_system_beep ? "ON" : "OFF");
    spdlog::info("  Telegram alerts: {}", telegram_enabled() ? "ON" : "OFF");
}
