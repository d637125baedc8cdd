#include "config.hpp"
#include "telegram_client.hpp"
#include "redis_bus.hpp"
#include "pipeline.hpp"
#include "relay.hpp"
#include "poller.hpp"
#include "keep_alive.hpp"
#include "health.hpp"
#include "status_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("signal_relay", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

// Resolves "@name" or a numeric id to the numeric chat id
int64_t resolve_chat(TelegramClient& tg_client, const std::string& chat, const char* role) {
    auto response = tg_client.get_chat(chat);
    if (!response.value("ok", false)) {
        throw std::runtime_error(fmt::format(
            "Cannot access {} chat {}: {}. Make sure the bot is a member of the channel",
            role, chat, response.value("description", std::string("unknown error"))));
    }

    const auto& result = response["result"];
    spdlog::info("Resolved {} chat: {}", role, result.value("title", chat));
    return result["id"].get<int64_t>();
}

// Components live in this scope so every CURL handle is gone before global cleanup
void run_relay(const Config& config) {
    TelegramClient tg_client(config.tg_bot_token);

    if (!tg_client.get_me()) {
        throw std::runtime_error("Bot token rejected by Telegram");
    }
    spdlog::info("Bot connected successfully");

    // Polling and webhooks are mutually exclusive on the Bot API
    if (!tg_client.delete_webhook()) {
        spdlog::warn("deleteWebhook failed, getUpdates may be rejected");
    }

    int64_t source_id = resolve_chat(tg_client, config.source_chat, "source");
    resolve_chat(tg_client, config.target_chat, "target");

    std::unique_ptr<RedisBus> redis;
    if (config.audit_enabled()) {
        redis = std::make_unique<RedisBus>(config.redis_url, config.audit_max_len);
    }

    SignalPipeline pipeline(config.retention_ms(), config.cooldown_ms(),
                            config.exchange_label);

    AuditFunction audit;
    if (redis) {
        audit = [&redis, &config](const nlohmann::json& event) {
            redis->publish_audit(config.stream_audit, event);
        };
    }

    const std::string target_chat = config.target_chat;
    SignalRelay relay(pipeline,
        [&tg_client, target_chat](const std::string& text) {
            return tg_client.send_message(target_chat, text);
        },
        audit);

    KeepAlive keep_alive(tg_client, config.keepalive_interval_seconds, config.keepalive_url);
    HealthCheck health(config, relay.stats(), pipeline.cache(), keep_alive, redis.get());
    StatusServer status_server(config, health, relay.stats());

    // getUpdates holds a handle for the whole long poll, keep it off the send path
    TelegramClient poll_client(config.tg_bot_token);
    ChannelPoller poller(poll_client, source_id,
        [&relay](const RawMessage& message) { relay.handle(message); });

    status_server.start();
    keep_alive.start();
    poller.start();

    spdlog::info("Bot is running...");

    while (!shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    spdlog::info("Shutdown requested");

    poller.stop();
    keep_alive.stop();
    status_server.stop();
}

int main() {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exit_code = 0;
    try {
        auto config = Config::from_env();

        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("Signal Relay v1.0");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        run_relay(config);

        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
