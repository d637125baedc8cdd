#include "config.hpp"
#include <spdlog/spdlog.h>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.tg_bot_token = get_env("TG_BOT_TOKEN");
    cfg.source_chat = get_env("SOURCE_CHAT");
    cfg.target_chat = get_env("TARGET_CHAT");

    cfg.redis_url = get_env("REDIS_URL");
    cfg.stream_audit = get_env("STREAM_AUDIT", "relay.audit");
    cfg.audit_max_len = get_env_int("AUDIT_MAXLEN", 10000);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("PORT", 10000);

    cfg.keepalive_interval_seconds = get_env_int("KEEPALIVE_INTERVAL_SECONDS", 180);
    cfg.keepalive_url = get_env("KEEPALIVE_URL");

    cfg.dedup_retention_seconds = get_env_int("DEDUP_RETENTION_SECONDS", 86400);
    cfg.symbol_cooldown_seconds = get_env_int("SYMBOL_COOLDOWN_SECONDS", 10);
    cfg.exchange_label = get_env("EXCHANGE_LABEL", "Binance Futures");

    cfg.service_name = get_env("SERVICE_NAME", "signal_relay");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (tg_bot_token.empty()) {
        throw std::runtime_error("TG_BOT_TOKEN is required");
    }
    if (source_chat.empty() || target_chat.empty()) {
        throw std::runtime_error("SOURCE_CHAT and TARGET_CHAT are required");
    }
    if (source_chat == target_chat) {
        throw std::runtime_error("SOURCE_CHAT and TARGET_CHAT must differ");
    }
    if (dedup_retention_seconds <= 0) {
        throw std::runtime_error("DEDUP_RETENTION_SECONDS must be positive");
    }
    if (symbol_cooldown_seconds < 0 || symbol_cooldown_seconds >= dedup_retention_seconds) {
        throw std::runtime_error("SYMBOL_COOLDOWN_SECONDS must be in [0, DEDUP_RETENTION_SECONDS)");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("PORT out of range");
    }
    if (audit_enabled() && audit_max_len <= 0) {
        throw std::runtime_error("AUDIT_MAXLEN must be positive");
    }
    if (keepalive_interval_seconds <= 0) {
        throw std::runtime_error("KEEPALIVE_INTERVAL_SECONDS must be positive");
    }

    spdlog::info("Configuration validated");
    spdlog::info("  Source: {} -> Target: {}", source_chat, target_chat);
    spdlog::info("  Dedup: retention={}s, cooldown={}s",
                 dedup_retention_seconds, symbol_cooldown_seconds);
    spdlog::info("  Audit: {}", audit_enabled() ? stream_audit : "disabled");
}
