#pragma once

#include "pipeline.hpp"
#include "signal.hpp"
#include <atomic>
#include <string>
#include <functional>
#include <cstdint>
#include <nlohmann/json.hpp>

struct RelayStats {
    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> forwarded{0};
    std::atomic<uint64_t> skipped{0};      // irrelevant or malformed
    std::atomic<uint64_t> suppressed{0};   // rejected by the dedup gate
    std::atomic<uint64_t> send_failures{0};
    std::atomic<int64_t> last_forward_ms{0};

    nlohmann::json to_json() const;
};

// Downstream delivery and audit hooks, so the relay can run without the network
using SendFunction = std::function<bool(const std::string& text)>;
using AuditFunction = std::function<void(const nlohmann::json& event)>;
using ClockFunction = std::function<int64_t()>;

class SignalRelay {
public:
    SignalRelay(SignalPipeline& pipeline,
                SendFunction send,
                AuditFunction audit = nullptr,
                ClockFunction clock = nullptr);

    // Returns true when the message was delivered downstream
    bool handle(const RawMessage& message);

    const RelayStats& stats() const { return stats_; }

private:
    SignalPipeline& pipeline_;
    SendFunction send_;
    AuditFunction audit_;
    ClockFunction clock_;
    RelayStats stats_;
};
