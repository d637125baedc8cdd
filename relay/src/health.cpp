#include "health.hpp"
#include "util.hpp"

nlohmann::json HealthCheck::get_status() const {
    bool telegram_ok = keep_alive_.telegram_ok();
    nlohmann::json redis_status = nullptr;
    nlohmann::json audit_status = nullptr;
    bool redis_ok = true;
    if (redis_) {
        redis_ok = redis_->ping();
        redis_status = redis_ok;
        audit_status = {
            {"stream", config_.stream_audit},
            {"published", redis_->published()},
            {"failures", redis_->publish_failures()}
        };
    }

    int64_t last_beat = keep_alive_.last_beat_ms();

    nlohmann::json status = {
        {"ok", telegram_ok && redis_ok},
        {"service", config_.service_name},
        {"telegram", telegram_ok},
        {"redis", redis_status},
        {"audit", audit_status},
        {"last_keepalive", last_beat > 0 ? nlohmann::json(util::format_iso8601(last_beat))
                                         : nlohmann::json(nullptr)},
        {"stats", stats_.to_json()},
        {"dedup", {
            {"fingerprints", cache_.seen_count()},
            {"cooldowns", cache_.cooldown_count()},
            {"retention_seconds", config_.dedup_retention_seconds},
            {"cooldown_seconds", config_.symbol_cooldown_seconds}
        }},
        {"ts", util::current_iso8601()}
    };

    return status;
}

bool HealthCheck::is_healthy() const {
    if (!keep_alive_.telegram_ok()) return false;
    return redis_ == nullptr || redis_->ping();
}
