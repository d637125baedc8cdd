#pragma once

#include <string>
#include <cstdlib>
#include <cstdint>
#include <stdexcept>

struct Config {
    // Telegram
    std::string tg_bot_token;
    std::string source_chat;   // "@channel" or numeric id
    std::string target_chat;

    // Redis audit bus (empty url disables it)
    std::string redis_url;
    std::string stream_audit;
    int audit_max_len;

    // HTTP status server
    std::string listen_addr;
    int listen_port;

    // Keep-alive
    int keepalive_interval_seconds;
    std::string keepalive_url;

    // Pipeline
    int dedup_retention_seconds;
    int symbol_cooldown_seconds;
    std::string exchange_label;

    // Service
    std::string service_name;
    std::string log_level;

    int64_t retention_ms() const { return static_cast<int64_t>(dedup_retention_seconds) * 1000; }
    int64_t cooldown_ms() const { return static_cast<int64_t>(symbol_cooldown_seconds) * 1000; }
    bool audit_enabled() const { return !redis_url.empty(); }

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
