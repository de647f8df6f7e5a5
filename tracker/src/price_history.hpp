#pragma once

#include "types.hpp"
#include <vector>
#include <optional>
#include <utility>
#include <cstdint>

// Insertion-ordered price store backed by an index-addressed ring buffer.
// Timestamps are strictly increasing. With a non-zero retention, points older
// than (newest - retention) are evicted, but never below min_points entries.
class PriceHistory {
public:
    explicit PriceHistory(int64_t retention_ms = 0, size_t min_points = 0,
                          size_t initial_capacity = 64);

    // Throws OutOfOrderError if point.timestamp_ms <= newest timestamp.
    // History is unchanged on rejection.
    void record(const PricePoint& point);

    // Mean of the last `period` prices, nullopt until `period` points exist
    std::optional<double> sma(size_t period) const;

    // Baseline is the earliest point with timestamp >= now - window.
    // Nullopt when fewer than 2 points fall in the window.
    std::optional<WindowDrop> windowed_drop(int window_minutes, int64_t now_ms) const;

    // Copy, oldest first
    std::vector<PricePoint> export_points() const;

    // Replaces all points (snapshot restore). Strong guarantee: throws
    // OutOfOrderError and leaves the history untouched if `points` is unordered.
    void replace(const std::vector<PricePoint>& points);
    void clear();

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    size_t capacity() const { return buffer_.size(); }
    size_t evicted_count() const { return evicted_; }

    std::optional<PricePoint> latest() const;
    // {min, max} over retained points
    std::optional<std::pair<double, double>> price_range() const;

private:
    // i-th oldest retained point
    const PricePoint& at(size_t i) const;
    void grow();
    void evict_expired();
    size_t first_index_at_or_after(int64_t timestamp_ms) const;

    std::vector<PricePoint> buffer_;
    size_t head_ = 0;
    size_t count_ = 0;
    int64_t retention_ms_;
    size_t min_points_;
    size_t evicted_ = 0;
};
