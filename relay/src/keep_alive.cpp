#include "keep_alive.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <chrono>

namespace {

size_t discard_body(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

KeepAlive::KeepAlive(TelegramClient& tg_client, int interval_seconds, const std::string& ping_url)
    : tg_client_(tg_client)
    , interval_seconds_(interval_seconds)
    , ping_url_(ping_url)
{}

KeepAlive::~KeepAlive() {
    stop();
}

void KeepAlive::start() {
    if (running_) return;

    running_ = true;
    thread_ = std::thread(&KeepAlive::loop, this);
    spdlog::info("Keep-alive enabled: ping every {}s", interval_seconds_);
}

void KeepAlive::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("Keep-alive stopped");
}

void KeepAlive::loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::seconds(interval_seconds_),
                         [this] { return !running_; });
            if (!running_) break;
        }

        try {
            beat();
        } catch (const std::exception& e) {
            spdlog::error("Keep-alive error: {}", e.what());
        }
    }
}

void KeepAlive::beat() {
    last_beat_ms_ = util::current_timestamp_ms();
    spdlog::info("Keep-alive ping at {}", util::format_iso8601(last_beat_ms_));

    bool ok = tg_client_.get_me();
    telegram_ok_ = ok;
    if (ok) {
        spdlog::info("   Bot is active and connected");
    } else {
        spdlog::warn("   Bot API unreachable, will retry on next ping");
    }

    if (!ping_url_.empty() && !self_ping()) {
        spdlog::warn("   Self-ping to {} failed", ping_url_);
    }
}

bool KeepAlive::self_ping() const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        spdlog::error("Failed to initialize CURL for self-ping");
        return false;
    }

    curl_easy_setopt(curl, CURLOPT_URL, ping_url_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    } else {
        spdlog::debug("Self-ping error: {}", curl_easy_strerror(res));
    }

    curl_easy_cleanup(curl);
    return res == CURLE_OK && status < 400;
}
