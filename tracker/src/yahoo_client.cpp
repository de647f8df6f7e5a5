#include "yahoo_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

YahooChartClient::YahooChartClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for Yahoo");
    }
    
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "Mozilla/5.0 (pricewatch)");
}

YahooChartClient::~YahooChartClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t YahooChartClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json YahooChartClient::make_request(const std::string& endpoint) {
    std::string response_string;
    std::string url = base_url_ + endpoint;
    
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    
    CURLcode res = curl_easy_perform(curl_);
    
    if (res != CURLE_OK) {
        throw QuoteError(std::string("request failed: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        throw QuoteError("HTTP " + std::to_string(status));
    }
    
    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw QuoteError(std::string("malformed response: ") + e.what());
    }
}

Quote YahooChartClient::get_quote(const std::string& ticker) {
    char* escaped = curl_easy_escape(curl_, ticker.c_str(), static_cast<int>(ticker.length()));
    std::string endpoint = "/v8/finance/chart/" + std::string(escaped) + "?interval=1m&range=1d";
    curl_free(escaped);

    auto response = make_request(endpoint);
    return parse_chart(ticker, response);
}

Quote YahooChartClient::parse_chart(const std::string& ticker, const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("chart")) {
        throw QuoteError("malformed response: no chart");
    }

    const auto& chart = response["chart"];
    if (chart.contains("error") && !chart["error"].is_null()) {
        throw QuoteError("chart error: " + chart["error"].value("description", chart["error"].dump()));
    }
    if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
        throw QuoteError("Empty history data");
    }

    const auto& result = chart["result"][0];
    Quote quote{ticker, 0.0, util::current_timestamp_ms()};

    // Walk the 1m closes backwards, the newest bar may still be null
    if (result.contains("indicators") && result["indicators"].contains("quote") &&
        result["indicators"]["quote"].is_array() && !result["indicators"]["quote"].empty()) {
        const auto& closes = result["indicators"]["quote"][0].value("close", nlohmann::json::array());
        const auto timestamps = result.value("timestamp", nlohmann::json::array());

        for (size_t i = closes.size(); i-- > 0;) {
            if (closes[i].is_number()) {
                quote.price = closes[i].get<double>();
                if (i < timestamps.size() && timestamps[i].is_number_integer()) {
                    quote.timestamp_ms = timestamps[i].get<int64_t>() * 1000;
                }
                return quote;
            }
        }
    }

    if (result.contains("meta") && result["meta"].contains("regularMarketPrice") &&
        result["meta"]["regularMarketPrice"].is_number()) {
        quote.price = result["meta"]["regularMarketPrice"].get<double>();
        if (result["meta"].contains("regularMarketTime") &&
            result["meta"]["regularMarketTime"].is_number_integer()) {
            quote.timestamp_ms = result["meta"]["regularMarketTime"].get<int64_t>() * 1000;
        }
        spdlog::debug("No 1m close for {}, using regularMarketPrice", ticker);
        return quote;
    }

    throw QuoteError("Empty history data");
}
