#pragma once

#include "config.hpp"
#include "relay.hpp"
#include "dedup_cache.hpp"
#include "redis_bus.hpp"
#include "keep_alive.hpp"
#include <nlohmann/json.hpp>

class HealthCheck {
public:
    // redis may be null when the audit bus is disabled
    HealthCheck(const Config& config,
                const RelayStats& stats,
                const DedupCache& cache,
                const KeepAlive& keep_alive,
                RedisBus* redis)
        : config_(config), stats_(stats), cache_(cache),
          keep_alive_(keep_alive), redis_(redis) {}

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    const Config& config_;
    const RelayStats& stats_;
    const DedupCache& cache_;
    const KeepAlive& keep_alive_;
    RedisBus* redis_;
};
