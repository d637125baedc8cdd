#include "poller.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>
#include <utility>

ChannelPoller::ChannelPoller(TelegramClient& tg_client,
                             int64_t source_chat_id,
                             MessageHandler handler)
    : tg_client_(tg_client)
    , source_chat_id_(source_chat_id)
    , handler_(std::move(handler))
{}

ChannelPoller::~ChannelPoller() {
    stop();
}

void ChannelPoller::start() {
    if (running_) {
        spdlog::warn("Poller already running");
        return;
    }

    running_ = true;
    poll_thread_ = std::thread(&ChannelPoller::poll_loop, this);
    spdlog::info("Channel poller started for chat {}", source_chat_id_);
}

void ChannelPoller::stop() {
    if (!running_) return;

    running_ = false;
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
    spdlog::info("Channel poller stopped");
}

void ChannelPoller::poll_loop() {
    while (running_) {
        try {
            auto response = tg_client_.get_updates(last_update_id_ + 1, 30);

            if (!response.value("ok", false)) {
                spdlog::error("getUpdates failed: {}", response.dump());
                std::this_thread::sleep_for(std::chrono::seconds(5));
                continue;
            }

            for (const auto& update : response["result"]) {
                int64_t update_id = update.value("update_id", int64_t{0});
                if (update_id > last_update_id_) {
                    last_update_id_ = update_id;
                }

                try {
                    process_update(update);
                } catch (const std::exception& e) {
                    spdlog::error("Error handling update {}: {}", update_id, e.what());
                }
            }

        } catch (const std::exception& e) {
            spdlog::error("Poll loop error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(5));
        }
    }
}

void ChannelPoller::process_update(const nlohmann::json& update) {
    auto message = to_raw_message(update, source_chat_id_);
    if (!message) return;

    handler_(*message);
}

std::optional<RawMessage> ChannelPoller::to_raw_message(const nlohmann::json& update,
                                                        int64_t source_chat_id) {
    const nlohmann::json* post = nullptr;
    if (update.contains("channel_post")) {
        post = &update["channel_post"];
    } else if (update.contains("message")) {
        post = &update["message"];
    } else {
        return std::nullopt;
    }

    if (!post->contains("chat") || !post->contains("message_id")) {
        return std::nullopt;
    }

    int64_t chat_id = (*post)["chat"].value("id", int64_t{0});
    if (chat_id != source_chat_id) {
        return std::nullopt;
    }

    RawMessage msg;
    msg.id = (*post)["message_id"].get<int64_t>();
    // Media posts carry their text as a caption
    if (post->contains("text")) {
        msg.text = (*post)["text"].get<std::string>();
    } else if (post->contains("caption")) {
        msg.text = (*post)["caption"].get<std::string>();
    }
    return msg;
}
