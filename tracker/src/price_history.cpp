#include "price_history.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>

PriceHistory::PriceHistory(int64_t retention_ms, size_t min_points, size_t initial_capacity)
    : buffer_(std::max<size_t>(initial_capacity, 1))
    , retention_ms_(retention_ms)
    , min_points_(min_points)
{}

const PricePoint& PriceHistory::at(size_t i) const {
    return buffer_[(head_ + i) % buffer_.size()];
}

void PriceHistory::record(const PricePoint& point) {
    if (count_ > 0) {
        const auto& newest = at(count_ - 1);
        if (point.timestamp_ms <= newest.timestamp_ms) {
            throw OutOfOrderError("timestamp " + util::to_iso8601_ms(point.timestamp_ms) +
                                  " is not after newest " +
                                  util::to_iso8601_ms(newest.timestamp_ms));
        }
    }

    if (count_ == buffer_.size()) {
        grow();
    }

    buffer_[(head_ + count_) % buffer_.size()] = point;
    count_++;

    evict_expired();
}

void PriceHistory::grow() {
    std::vector<PricePoint> bigger(buffer_.size() * 2);
    for (size_t i = 0; i < count_; i++) {
        bigger[i] = at(i);
    }
    buffer_.swap(bigger);
    head_ = 0;
}

void PriceHistory::evict_expired() {
    if (retention_ms_ <= 0 || count_ == 0) return;

    int64_t cutoff_ms = at(count_ - 1).timestamp_ms - retention_ms_;

    while (count_ > min_points_ && at(0).timestamp_ms < cutoff_ms) {
        head_ = (head_ + 1) % buffer_.size();
        count_--;
        evicted_++;
    }
}

std::optional<double> PriceHistory::sma(size_t period) const {
    if (period == 0 || count_ < period) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (size_t i = count_ - period; i < count_; i++) {
        sum += at(i).price;
    }
    return sum / static_cast<double>(period);
}

size_t PriceHistory::first_index_at_or_after(int64_t timestamp_ms) const {
    // Timestamps are sorted, binary search over logical indices
    size_t lo = 0;
    size_t hi = count_;
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (at(mid).timestamp_ms < timestamp_ms) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return lo;
}

std::optional<WindowDrop> PriceHistory::windowed_drop(int window_minutes, int64_t now_ms) const {
    int64_t window_start_ms = now_ms - static_cast<int64_t>(window_minutes) * 60 * 1000;
    size_t first = first_index_at_or_after(window_start_ms);

    if (count_ - first < 2) {
        return std::nullopt;
    }

    const auto& baseline = at(first);
    const auto& current = at(count_ - 1);

    if (baseline.price <= 0) {
        return std::nullopt;
    }

    WindowDrop drop;
    drop.baseline = baseline.price;
    drop.current = current.price;
    drop.pct_change = ((current.price - baseline.price) / baseline.price) * 100.0;
    drop.baseline_ts_ms = baseline.timestamp_ms;
    drop.current_ts_ms = current.timestamp_ms;
    drop.points_in_window = count_ - first;
    return drop;
}

std::vector<PricePoint> PriceHistory::export_points() const {
    std::vector<PricePoint> points;
    points.reserve(count_);
    for (size_t i = 0; i < count_; i++) {
        points.push_back(at(i));
    }
    return points;
}

void PriceHistory::replace(const std::vector<PricePoint>& points) {
    PriceHistory fresh(retention_ms_, min_points_, std::max<size_t>(buffer_.size(), points.size()));
    for (const auto& p : points) {
        fresh.record(p);
    }
    *this = std::move(fresh);
}

void PriceHistory::clear() {
    head_ = 0;
    count_ = 0;
    evicted_ = 0;
}

std::optional<PricePoint> PriceHistory::latest() const {
    if (count_ == 0) return std::nullopt;
    return at(count_ - 1);
}

std::optional<std::pair<double, double>> PriceHistory::price_range() const {
    if (count_ == 0) return std::nullopt;

    double lo = at(0).price;
    double hi = at(0).price;
    for (size_t i = 1; i < count_; i++) {
        lo = std::min(lo, at(i).price);
        hi = std::max(hi, at(i).price);
    }
    return std::make_pair(lo, hi);
}
