#include "retrying_fetcher.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>

std::chrono::milliseconds RetryPolicy::delay_before_attempt(int attempt) const {
    if (attempt < 2) {
        return std::chrono::milliseconds(0);
    }

    auto delay = base_delay;
    for (int i = 2; i < attempt && delay < max_delay; i++) {
        delay *= 2;
    }
    return std::min(delay, max_delay);
}

RetryingFetcher::RetryingFetcher(QuoteSource& source, RetryPolicy policy, Sleeper sleeper)
    : source_(source)
    , policy_(policy)
    , sleeper_(std::move(sleeper))
{
    // Attempt counter runs to max_retries + 1 and must not overflow
    policy_.max_retries = std::clamp(policy_.max_retries, 0, std::numeric_limits<int>::max() - 2);
}

FetchResult RetryingFetcher::fetch(const std::string& ticker) {
    FetchResult result;
    const int max_attempts = policy_.max_retries + 1;

    for (int attempt = 1; attempt <= max_attempts; attempt++) {
        if (attempt > 1) {
            auto delay = policy_.delay_before_attempt(attempt);
            if (!sleeper_(delay)) {
                spdlog::info("Fetch for {} cancelled during backoff", ticker);
                result.cancelled = true;
                return result;
            }
        }

        result.attempts = attempt;
        stats_.attempts++;

        try {
            Quote quote = source_.get_quote(ticker);
            if (!std::isfinite(quote.price) || quote.price <= 0) {
                throw QuoteError("invalid price " + std::to_string(quote.price));
            }
            spdlog::debug("Price fetched for {}: ${:.2f} (attempt {})", ticker, quote.price, attempt);
            result.quote = quote;
            result.last_error.clear();
            return result;

        } catch (const std::exception& e) {
            stats_.failures++;
            result.last_error = e.what();

            if (attempt < max_attempts) {
                spdlog::warn("Attempt {}/{} for {} failed: {}", attempt, max_attempts, ticker, e.what());
            }
        }
    }

    stats_.exhausted++;
    spdlog::error("Failed to fetch price for {} after {} attempts: {}",
                  ticker, result.attempts, result.last_error);
    return result;
}
