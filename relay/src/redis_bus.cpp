#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url, long long audit_max_len)
    : audit_max_len_(audit_max_len) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        redis_->ping();
        spdlog::info("Audit bus connected (stream cap {})", audit_max_len_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::publish_audit(const std::string& stream, const nlohmann::json& event) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = event.dump();

    try {
        // Approximate trimming keeps XADD O(1)
        redis_->xadd(stream, "*", fields.begin(), fields.end(), audit_max_len_, true);
        published_++;
        spdlog::debug("Audit {} -> {}: message {} {}", stream, event.value("event", ""),
                      event.value("message_id", int64_t{0}), event.value("verdict", ""));
    } catch (const sw::redis::Error& e) {
        publish_failures_++;
        spdlog::warn("Audit publish to {} failed: {}", stream, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis ping failed: {}", e.what());
        return false;
    }
}
