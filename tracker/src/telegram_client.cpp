#include "telegram_client.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

TelegramClient::TelegramClient(const std::string& bot_token, std::string chat_id,
                               int timeout_ms, const std::string& api_base)
    : endpoint_(api_base + "/bot" + bot_token)
    , chat_id_(std::move(chat_id))
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for Telegram");
    }
    
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
}

TelegramClient::~TelegramClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t TelegramClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json TelegramClient::post(const std::string& method, const nlohmann::json& body) {
    std::string url = endpoint_ + "/" + method;
    std::string payload = body.dump();
    std::string response_string;
    
    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    
    CURLcode res = curl_easy_perform(curl_);
    
    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, static_cast<struct curl_slist*>(nullptr));
    curl_slist_free_all(headers);
    
    if (res != CURLE_OK) {
        return {{"ok", false}, {"description", curl_easy_strerror(res)}};
    }
    
    try {
        return nlohmann::json::parse(response_string);
    } catch (const nlohmann::json::exception&) {
        return {{"ok", false}, {"description", "HTTP " + std::to_string(http_code) + ", unparseable body"}};
    }
}

bool TelegramClient::send(const std::string& message) {
    auto response = post("sendMessage", {
        {"chat_id", chat_id_},
        {"text", message},
        {"disable_web_page_preview", true}
    });
    
    if (!response.is_object() || !response.value("ok", false)) {
        std::string reason = response.is_object() ? response.value("description", response.dump())
                                                  : response.dump();
        spdlog::error("Telegram sendMessage failed: {}", reason);
        return false;
    }
    
    spdlog::info("Telegram alert sent to chat {}", chat_id_);
    return true;
}
