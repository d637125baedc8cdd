#include "pipeline.hpp"
#include "classifier.hpp"
#include "util.hpp"
#include <utility>

std::string PipelineDecision::reason() const {
    if (verdict) {
        return verdict_string(*verdict);
    }
    if (classification.intent == MessageIntent::Irrelevant) {
        return "irrelevant";
    }
    return "not_rendered";
}

SignalPipeline::SignalPipeline(int64_t retention_ms, int64_t cooldown_ms,
                               const std::string& exchange_label)
    : formatter_(exchange_label)
    , cache_(retention_ms, cooldown_ms)
{}

std::optional<std::string> SignalPipeline::process(const std::string& text, int64_t arrival_ms) {
    return evaluate(text, arrival_ms).output;
}

std::optional<std::string> SignalPipeline::process(const RawMessage& message, int64_t arrival_ms) {
    return process(message.text, arrival_ms);
}

// A close is never a burst of the open it follows, so each intent cools down on its own
std::string SignalPipeline::cooldown_key(const Classification& classification) {
    if (classification.symbol.empty()) {
        return "";
    }
    return classification.intent_string() + ":" + classification.symbol;
}

PipelineDecision SignalPipeline::evaluate(const std::string& text, int64_t arrival_ms) {
    // Expire old entries on every message, rendered or not
    cache_.sweep(arrival_ms);

    PipelineDecision decision;
    decision.classification = SignalClassifier::classify(text);

    auto candidate = formatter_.format(decision.classification);
    if (!candidate) {
        return decision;
    }

    // Gate on the raw text so case and spacing variants of a repost collide
    decision.fingerprint = util::content_fingerprint(text);
    decision.verdict = cache_.check_and_record(text, cooldown_key(decision.classification),
                                               arrival_ms);

    if (*decision.verdict == DedupVerdict::Accepted) {
        decision.output = std::move(candidate);
    }

    return decision;
}
