#pragma once

#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

// Tabular dump of the price history: timestamp,price,sma
class CsvExporter {
public:
    CsvExporter(std::string export_dir, std::string ticker, size_t sma_period);

    // Writes <export_dir>/<ticker>_price_history_<YYYYmmdd_HHMMSS>.csv.
    // Nullopt when there is nothing to export or the write failed.
    std::optional<std::filesystem::path> export_points(const std::vector<PricePoint>& points,
                                                       int64_t now_ms) const;

    // Throws PersistenceError
    static void write(const std::filesystem::path& path,
                      const std::vector<PricePoint>& points, size_t sma_period);

    std::filesystem::path default_path(int64_t now_ms) const;

private:
    std::string export_dir_;
    std::string ticker_;
    size_t sma_period_;
};
