#pragma once

#include "notifier.hpp"
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Bot API sendMessage to a single chat
class TelegramClient : public Notifier {
public:
    TelegramClient(const std::string& bot_token, std::string chat_id,
                   int timeout_ms = 30000,
                   const std::string& api_base = "https://api.telegram.org");
    ~TelegramClient() override;
    
    TelegramClient(const TelegramClient&) = delete;
    TelegramClient& operator=(const TelegramClient&) = delete;
    
    bool send(const std::string& message) override;
    std::string name() const override { return "telegram"; }
    
private:
    std::string endpoint_;
    std::string chat_id_;
    CURL* curl_;
    
    // {"ok": false, "description": ...} on transport or parse failure
    nlohmann::json post(const std::string& method, const nlohmann::json& body);
    
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
