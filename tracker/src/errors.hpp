#pragma once

#include <stdexcept>
#include <string>

// Transport failure, bad HTTP status, malformed or empty quote payload.
// Always retryable.
class QuoteError : public std::runtime_error {
public:
    explicit QuoteError(const std::string& what) : std::runtime_error(what) {}
};

// PriceHistory::record with a timestamp not after the newest point
class OutOfOrderError : public std::runtime_error {
public:
    explicit OutOfOrderError(const std::string& what) : std::runtime_error(what) {}
};

// Unreadable or malformed session data
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};
