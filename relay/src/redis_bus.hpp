#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

// Audit sink. Every relay decision is appended to a capped stream.
class RedisBus {
public:
    RedisBus(const std::string& redis_url, long long audit_max_len);

    // Never throws: a broken audit bus must not stop delivery
    void publish_audit(const std::string& stream, const nlohmann::json& event);

    bool ping();

    uint64_t published() const { return published_; }
    uint64_t publish_failures() const { return publish_failures_; }

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    long long audit_max_len_;
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> publish_failures_{0};
};
