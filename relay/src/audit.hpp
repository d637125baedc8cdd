#pragma once
#include "pipeline.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

class Auditor {
public:
    static nlohmann::json build_audit_event(int64_t message_id,
                                            const PipelineDecision& decision,
                                            int64_t arrival_ms);
};
