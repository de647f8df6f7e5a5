#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

LogSettings log_settings_from_env() {
    LogSettings settings;
    const char* level = std::getenv("LOG_LEVEL");
    if (level && *level) settings.level = level;
    const char* file = std::getenv("LOG_FILE");
    if (file && *file) settings.file = file;
    return settings;
}

void setup_logging(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    
    if (!settings.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Could not open log file " << settings.file << ": " << e.what() << std::endl;
        }
    }
    
    auto logger = std::make_shared<spdlog::logger>("pricewatch", sinks.begin(), sinks.end());
    
    if (settings.level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (settings.level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (settings.level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}
