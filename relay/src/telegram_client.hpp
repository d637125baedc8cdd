#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <mutex>
#include <cstdint>

// Bot API client. One CURL easy handle, requests serialized by a mutex.
class TelegramClient {
public:
    explicit TelegramClient(const std::string& bot_token);
    ~TelegramClient();

    TelegramClient(const TelegramClient&) = delete;
    TelegramClient& operator=(const TelegramClient&) = delete;

    // Plain text, no parse mode, so '#' and '/' reach the target untouched.
    // Flood-wait replies are retried a bounded number of times.
    bool send_message(const std::string& chat, const std::string& text);

    // Long polling, restricted to messages and channel posts
    nlohmann::json get_updates(int64_t offset, int timeout = 30);

    nlohmann::json get_chat(const std::string& chat);
    bool get_me();
    bool delete_webhook();

    static constexpr int MAX_SEND_ATTEMPTS = 3;
    static constexpr int MAX_RETRY_AFTER_SECONDS = 30;

private:
    std::string api_base_;
    CURL* curl_;
    curl_slist* headers_;
    std::mutex mutex_;

    nlohmann::json call(const std::string& method,
                        const nlohmann::json& body = nlohmann::json::object(),
                        long timeout_seconds = 30);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
