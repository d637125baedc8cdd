#pragma once

#include "telegram_client.hpp"
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <string>
#include <cstdint>

class KeepAlive {
public:
    KeepAlive(TelegramClient& tg_client, int interval_seconds, const std::string& ping_url = "");
    ~KeepAlive();

    void start();
    void stop();

    bool telegram_ok() const { return telegram_ok_; }
    int64_t last_beat_ms() const { return last_beat_ms_; }

private:
    TelegramClient& tg_client_;
    int interval_seconds_;
    std::string ping_url_;

    std::atomic<bool> running_{false};
    std::atomic<bool> telegram_ok_{true};
    std::atomic<int64_t> last_beat_ms_{0};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void loop();
    void beat();
    bool self_ping() const;
};
