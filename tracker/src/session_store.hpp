#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

struct SessionSnapshot {
    std::string ticker;
    std::vector<PricePoint> prices;
    std::optional<int64_t> last_alert_ms;
    uint64_t checkpoint_seq = 0;

    bool operator==(const SessionSnapshot& other) const {
        return ticker == other.ticker && prices == other.prices &&
               last_alert_ms == other.last_alert_ms && checkpoint_seq == other.checkpoint_seq;
    }
};

nlohmann::json session_to_json(const SessionSnapshot& snapshot);
// Throws PersistenceError on missing fields, bad timestamps or unordered prices
SessionSnapshot session_from_json(const nlohmann::json& j);

class SessionStore {
public:
    SessionStore(std::filesystem::path path, std::string ticker);

    // Writes <path>.tmp then renames over <path>. Returns false on failure,
    // the previous snapshot is left intact.
    bool save(const SessionSnapshot& snapshot);

    // Nullopt when there is no file, it cannot be parsed, or it belongs to
    // another instrument
    std::optional<SessionSnapshot> load() const;

    const std::filesystem::path& path() const { return path_; }

    static std::filesystem::path default_path(const std::string& dir, const std::string& ticker);

private:
    std::filesystem::path path_;
    std::string ticker_;
};
