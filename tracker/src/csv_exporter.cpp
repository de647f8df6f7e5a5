#include "csv_exporter.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

CsvExporter::CsvExporter(std::string export_dir, std::string ticker, size_t sma_period)
    : export_dir_(std::move(export_dir))
    , ticker_(std::move(ticker))
    , sma_period_(sma_period)
{}

std::filesystem::path CsvExporter::default_path(int64_t now_ms) const {
    std::filesystem::path dir = export_dir_.empty() ? std::filesystem::path(".")
                                                    : std::filesystem::path(export_dir_);
    return dir / (ticker_ + "_price_history_" + util::compact_timestamp(now_ms) + ".csv");
}

void CsvExporter::write(const std::filesystem::path& path,
                        const std::vector<PricePoint>& points, size_t sma_period) {
    auto tmp_path = path;
    tmp_path += ".tmp";

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out) {
            throw PersistenceError("cannot open " + tmp_path.string() + " for writing");
        }

        out << "timestamp,price,sma\n";

        // Rolling sum over the last sma_period prices
        double window_sum = 0.0;
        for (size_t i = 0; i < points.size(); i++) {
            window_sum += points[i].price;
            if (sma_period > 0 && i >= sma_period) {
                window_sum -= points[i - sma_period].price;
            }

            std::string sma_col;
            if (sma_period > 0 && i + 1 >= sma_period) {
                sma_col = fmt::format("{:.6f}", window_sum / static_cast<double>(sma_period));
            }

            out << fmt::format("{},{},{}\n", util::to_iso8601_ms(points[i].timestamp_ms),
                               points[i].price, sma_col);
        }

        out.flush();
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            throw PersistenceError("write to " + tmp_path.string() + " failed");
        }
    }

    std::filesystem::rename(tmp_path, path);
}

std::optional<std::filesystem::path> CsvExporter::export_points(const std::vector<PricePoint>& points,
                                                                int64_t now_ms) const {
    if (points.empty()) {
        spdlog::warn("No data to export");
        return std::nullopt;
    }

    auto path = default_path(now_ms);
    try {
        write(path, points, sma_period_);
    } catch (const std::exception& e) {
        spdlog::error("Export to {} failed: {}", path.string(), e.what());
        return std::nullopt;
    }

    spdlog::info("Data exported to {} ({} rows)", path.string(), points.size());
    return path;
}
