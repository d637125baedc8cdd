#pragma once

#include "telegram_client.hpp"
#include "signal.hpp"
#include <atomic>
#include <thread>
#include <functional>
#include <optional>
#include <cstdint>

using MessageHandler = std::function<void(const RawMessage& message)>;

class ChannelPoller {
public:
    ChannelPoller(TelegramClient& tg_client,
                  int64_t source_chat_id,
                  MessageHandler handler);
    ~ChannelPoller();

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Extracts the source post from an update, nullopt for anything else
    static std::optional<RawMessage> to_raw_message(const nlohmann::json& update,
                                                    int64_t source_chat_id);

private:
    TelegramClient& tg_client_;
    int64_t source_chat_id_;
    MessageHandler handler_;

    std::atomic<bool> running_{false};
    std::thread poll_thread_;
    int64_t last_update_id_ = 0;

    void poll_loop();
    void process_update(const nlohmann::json& update);
};
