#include "audit.hpp"
#include "util.hpp"

nlohmann::json Auditor::build_audit_event(int64_t message_id,
                                          const PipelineDecision& decision,
                                          int64_t arrival_ms) {
    nlohmann::json event = {
        {"event", decision.forward() ? "forwarded" : "dropped"},
        {"message_id", message_id},
        {"intent", decision.classification.intent_string()},
        {"symbol", decision.classification.symbol},
        {"verdict", decision.reason()},
        {"fingerprint", decision.fingerprint},
        {"forwarded", decision.forward()},
        {"ts", util::format_iso8601(arrival_ms)}
    };

    if (decision.classification.signal) {
        const auto& s = *decision.classification.signal;
        event["signal"] = {
            {"direction", direction_string(s.direction)},
            {"leverage", s.leverage},
            {"entry", s.entry_price},
            {"target", s.take_profit},
            {"stop_loss", s.stop_loss}
        };
    }

    return event;
}
