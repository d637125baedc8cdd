#pragma once

#include "signal.hpp"
#include "formatter.hpp"
#include "dedup_cache.hpp"
#include <string>
#include <optional>
#include <cstdint>

struct PipelineDecision {
    Classification classification;
    std::optional<DedupVerdict> verdict;   // unset when nothing was rendered
    std::string fingerprint;
    std::optional<std::string> output;     // text to deliver downstream

    bool forward() const { return output.has_value(); }
    std::string reason() const;
};

// Classifier -> formatter -> dedup gate. Owns the dedup state; one instance
// per relayed channel.
class SignalPipeline {
public:
    SignalPipeline(int64_t retention_ms, int64_t cooldown_ms,
                   const std::string& exchange_label = SignalFormatter::DEFAULT_EXCHANGE);

    std::optional<std::string> process(const std::string& text, int64_t arrival_ms);
    std::optional<std::string> process(const RawMessage& message, int64_t arrival_ms);

    PipelineDecision evaluate(const std::string& text, int64_t arrival_ms);

    const DedupCache& cache() const { return cache_; }
    DedupCache& cache() { return cache_; }

    // "<intent>:<symbol>", empty when there is no symbol
    static std::string cooldown_key(const Classification& classification);

private:
    SignalFormatter formatter_;
    DedupCache cache_;
};
