#pragma once

#include "quote_source.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <cstdint>

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{16000};

    // base * 2^(attempt-2), capped. No delay before the first attempt.
    std::chrono::milliseconds delay_before_attempt(int attempt) const;
};

struct FetchResult {
    std::optional<Quote> quote;
    int attempts = 0;
    std::string last_error;
    bool cancelled = false;  // stop requested during a backoff wait

    bool ok() const { return quote.has_value(); }
};

struct FetchStats {
    uint64_t attempts = 0;
    uint64_t failures = 0;
    uint64_t exhausted = 0;
};

class RetryingFetcher {
public:
    // Waits for the given delay; returns false if the wait was interrupted
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    RetryingFetcher(QuoteSource& source, RetryPolicy policy, Sleeper sleeper);

    // Never throws for source failures, the caller decides whether to skip the cycle
    FetchResult fetch(const std::string& ticker);

    const FetchStats& stats() const { return stats_; }
    const RetryPolicy& policy() const { return policy_; }

private:
    QuoteSource& source_;
    RetryPolicy policy_;
    Sleeper sleeper_;
    FetchStats stats_;
};
