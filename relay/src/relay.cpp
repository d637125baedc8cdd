#include "relay.hpp"
#include "audit.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <utility>

nlohmann::json RelayStats::to_json() const {
    int64_t last_ms = last_forward_ms.load();
    return {
        {"received", received.load()},
        {"forwarded", forwarded.load()},
        {"skipped", skipped.load()},
        {"suppressed", suppressed.load()},
        {"send_failures", send_failures.load()},
        {"last_forward", last_ms > 0 ? nlohmann::json(util::format_iso8601(last_ms))
                                     : nlohmann::json(nullptr)}
    };
}

SignalRelay::SignalRelay(SignalPipeline& pipeline,
                         SendFunction send,
                         AuditFunction audit,
                         ClockFunction clock)
    : pipeline_(pipeline)
    , send_(std::move(send))
    , audit_(std::move(audit))
    , clock_(std::move(clock))
{}

bool SignalRelay::handle(const RawMessage& message) {
    stats_.received++;

    int64_t now_ms = clock_ ? clock_() : util::current_timestamp_ms();
    auto decision = pipeline_.evaluate(message.text, now_ms);

    bool delivered = false;

    if (!decision.verdict) {
        stats_.skipped++;
        spdlog::debug("Skipped message {} ({}): {}", message.id,
                      decision.reason(), util::preview(message.text));
    } else if (!decision.forward()) {
        stats_.suppressed++;
        spdlog::debug("Suppressed message {} ({}) for {}", message.id,
                     decision.reason(), decision.classification.symbol);
    } else {
        try {
            delivered = send_(*decision.output);
        } catch (const std::exception& e) {
            spdlog::error("Error forwarding message {}: {}", message.id, e.what());
        }

        if (delivered) {
            stats_.forwarded++;
            stats_.last_forward_ms = now_ms;
            spdlog::info("Forwarded message {} as {}", message.id,
                         decision.classification.intent_string());
            spdlog::info("   Original: {}", util::preview(message.text));
            spdlog::info("   Sent:     {}", util::preview(*decision.output));
        } else {
            stats_.send_failures++;
            spdlog::warn("Delivery failed for message {}", message.id);
        }
    }

    if (audit_) {
        try {
            auto event = Auditor::build_audit_event(message.id, decision, now_ms);
            event["delivered"] = delivered;
            audit_(event);
        } catch (const std::exception& e) {
            spdlog::error("Failed to audit message {}: {}", message.id, e.what());
        }
    }

    return delivered;
}
