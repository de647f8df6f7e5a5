#pragma once

#include <string>

struct LogSettings {
    std::string level = "info";
    std::string file = "price_tracker.log";

    bool operator==(const LogSettings& other) const {
        return level == other.level && file == other.file;
    }
    bool operator!=(const LogSettings& other) const { return !(*this == other); }
};

// LOG_LEVEL / LOG_FILE only, so logging is up before the config file is read
LogSettings log_settings_from_env();

// Colored stdout plus an appending file sink (skipped when file is empty)
void setup_logging(const LogSettings& settings);
