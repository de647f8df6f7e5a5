#pragma once

#include "quote_source.hpp"
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Quotes from the Yahoo Finance chart endpoint (1 minute bars, 1 day range)
class YahooChartClient : public QuoteSource {
public:
    explicit YahooChartClient(const std::string& base_url, int timeout_ms = 10000);
    ~YahooChartClient() override;

    YahooChartClient(const YahooChartClient&) = delete;
    YahooChartClient& operator=(const YahooChartClient&) = delete;

    Quote get_quote(const std::string& ticker) override;

    // Last non-null close, falling back to meta.regularMarketPrice
    static Quote parse_chart(const std::string& ticker, const nlohmann::json& response);

private:
    std::string base_url_;
    int timeout_ms_;
    CURL* curl_;

    nlohmann::json make_request(const std::string& endpoint);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
