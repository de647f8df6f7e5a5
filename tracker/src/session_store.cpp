#include "session_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace {

nlohmann::json timestamp_json(int64_t ts_ms) {
    return util::to_iso8601_ms(ts_ms);
}

int64_t timestamp_from_json(const nlohmann::json& j) {
    if (j.is_number_integer()) {
        return j.get<int64_t>();
    }
    if (j.is_string()) {
        auto ts = util::parse_iso8601_ms(j.get<std::string>());
        if (ts) return *ts;
        throw PersistenceError("bad timestamp '" + j.get<std::string>() + "'");
    }
    throw PersistenceError("timestamp must be an ISO-8601 string or epoch milliseconds");
}

} // namespace

nlohmann::json session_to_json(const SessionSnapshot& snapshot) {
    nlohmann::json prices = nlohmann::json::array();
    for (const auto& p : snapshot.prices) {
        prices.push_back({
            {"timestamp", timestamp_json(p.timestamp_ms)},
            {"price", p.price}
        });
    }

    return {
        {"ticker", snapshot.ticker},
        {"prices", prices},
        {"last_alert_time", snapshot.last_alert_ms ? timestamp_json(*snapshot.last_alert_ms)
                                                   : nlohmann::json(nullptr)},
        {"checkpoint_sequence_number", snapshot.checkpoint_seq}
    };
}

SessionSnapshot session_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw PersistenceError("session root is not an object");
    }
    if (!j.contains("ticker") || !j["ticker"].is_string()) {
        throw PersistenceError("missing ticker");
    }
    if (!j.contains("prices") || !j["prices"].is_array()) {
        throw PersistenceError("missing prices array");
    }

    SessionSnapshot snapshot;
    snapshot.ticker = j["ticker"].get<std::string>();

    for (const auto& entry : j["prices"]) {
        if (!entry.is_object() || !entry.contains("timestamp") || !entry.contains("price") ||
            !entry["price"].is_number()) {
            throw PersistenceError("malformed price entry: " + entry.dump());
        }

        PricePoint point{timestamp_from_json(entry["timestamp"]), entry["price"].get<double>()};
        if (!snapshot.prices.empty() && point.timestamp_ms <= snapshot.prices.back().timestamp_ms) {
            throw PersistenceError("prices are not in strictly increasing time order");
        }
        snapshot.prices.push_back(point);
    }

    if (j.contains("last_alert_time") && !j["last_alert_time"].is_null()) {
        snapshot.last_alert_ms = timestamp_from_json(j["last_alert_time"]);
    }

    if (j.contains("checkpoint_sequence_number")) {
        if (!j["checkpoint_sequence_number"].is_number_unsigned()) {
            throw PersistenceError("checkpoint_sequence_number must be a non-negative integer");
        }
        snapshot.checkpoint_seq = j["checkpoint_sequence_number"].get<uint64_t>();
    }

    return snapshot;
}

SessionStore::SessionStore(std::filesystem::path path, std::string ticker)
    : path_(std::move(path))
    , ticker_(std::move(ticker))
{}

std::filesystem::path SessionStore::default_path(const std::string& dir, const std::string& ticker) {
    std::filesystem::path base = dir.empty() ? std::filesystem::path(".") : std::filesystem::path(dir);
    return base / (ticker + "_session.json");
}

bool SessionStore::save(const SessionSnapshot& snapshot) {
    auto tmp_path = path_;
    tmp_path += ".tmp";

    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }

        {
            std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
            if (!out) {
                throw PersistenceError("cannot open " + tmp_path.string() + " for writing");
            }
            out << session_to_json(snapshot).dump();
            out.flush();
            if (!out) {
                throw PersistenceError("write to " + tmp_path.string() + " failed");
            }
        }

        std::filesystem::rename(tmp_path, path_);

    } catch (const std::exception& e) {
        spdlog::error("Could not save session to {}: {}", path_.string(), e.what());
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    spdlog::debug("Session saved with {} records (checkpoint {})",
                  snapshot.prices.size(), snapshot.checkpoint_seq);
    return true;
}

std::optional<SessionSnapshot> SessionStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("No previous session at {}", path_.string());
        return std::nullopt;
    }

    SessionSnapshot snapshot;
    try {
        std::ifstream in(path_);
        if (!in) {
            throw PersistenceError("cannot open " + path_.string());
        }
        nlohmann::json j = nlohmann::json::parse(in);
        snapshot = session_from_json(j);

    } catch (const std::exception& e) {
        spdlog::warn("Could not load session from {}: {}; starting fresh", path_.string(), e.what());
        return std::nullopt;
    }

    if (snapshot.ticker != ticker_) {
        spdlog::warn("Session at {} is for {}, not {}; discarding",
                     path_.string(), snapshot.ticker, ticker_);
        return std::nullopt;
    }

    spdlog::info("Loaded {} records from previous session (checkpoint {})",
                 snapshot.prices.size(), snapshot.checkpoint_seq);
    return snapshot;
}
