#include "telegram_client.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

TelegramClient::TelegramClient(const std::string& bot_token)
    : api_base_("https://api.telegram.org/bot" + bot_token)
    , curl_(curl_easy_init())
    , headers_(nullptr)
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    headers_ = curl_slist_append(headers_, "Content-Type: application/json");

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
}

TelegramClient::~TelegramClient() {
    if (headers_) {
        curl_slist_free_all(headers_);
    }
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t TelegramClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json TelegramClient::call(const std::string& method,
                                    const nlohmann::json& body,
                                    long timeout_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string url = api_base_ + "/" + method;
    std::string payload = body.dump();
    std::string response_body;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        spdlog::error("Telegram {} failed: {}", method, curl_easy_strerror(res));
        return nlohmann::json{{"ok", false}, {"description", curl_easy_strerror(res)}};
    }

    // Error replies still carry a JSON body with ok=false
    auto reply = nlohmann::json::parse(response_body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        long http_code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
        spdlog::error("Telegram {} returned unparseable body (HTTP {})", method, http_code);
        return nlohmann::json{{"ok", false}, {"description", "unparseable response"}};
    }

    return reply;
}

bool TelegramClient::send_message(const std::string& chat, const std::string& text) {
    nlohmann::json body = {
        {"chat_id", chat},
        {"text", text},
        {"disable_web_page_preview", true}
    };

    for (int attempt = 1; attempt <= MAX_SEND_ATTEMPTS; attempt++) {
        auto reply = call("sendMessage", body);
        if (reply.value("ok", false)) {
            return true;
        }

        int retry_after = 0;
        if (reply.value("error_code", 0) == 429 && reply.contains("parameters")) {
            retry_after = reply["parameters"].value("retry_after", 0);
        }

        if (retry_after <= 0 || attempt == MAX_SEND_ATTEMPTS) {
            spdlog::error("sendMessage to {} rejected: {}", chat,
                          reply.value("description", std::string("unknown error")));
            return false;
        }

        retry_after = std::min(retry_after, MAX_RETRY_AFTER_SECONDS);
        spdlog::warn("Flood limit on {}, retrying in {}s (attempt {}/{})",
                     chat, retry_after, attempt, MAX_SEND_ATTEMPTS);
        std::this_thread::sleep_for(std::chrono::seconds(retry_after));
    }

    return false;
}

nlohmann::json TelegramClient::get_updates(int64_t offset, int timeout) {
    nlohmann::json body = {
        {"offset", offset},
        {"timeout", timeout},
        {"allowed_updates", nlohmann::json::array({"message", "channel_post"})}
    };

    // Leave headroom over the server-side long poll
    return call("getUpdates", body, timeout + 10);
}

nlohmann::json TelegramClient::get_chat(const std::string& chat) {
    return call("getChat", {{"chat_id", chat}});
}

bool TelegramClient::get_me() {
    auto reply = call("getMe");
    if (!reply.value("ok", false)) {
        spdlog::warn("getMe failed: {}", reply.value("description", std::string("unknown error")));
        return false;
    }
    return true;
}

bool TelegramClient::delete_webhook() {
    return call("deleteWebhook").value("ok", false);
}
