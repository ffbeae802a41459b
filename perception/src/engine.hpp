#pragma once

#include "decision.hpp"
#include "delta.hpp"
#include "input.hpp"
#include "override.hpp"
#include "snapshot.hpp"
#include <nlohmann/json.hpp>

struct MetaPerceptionOutput {
    PerceptionSnapshot snapshot;
    std::optional<PerceptionDelta> delta;  // absent on the first cycle
    MetaPerceptionDecision decision;
    std::optional<OverrideRecord> override_record;

    // Filled by the persistence layer, never by the engine
    std::map<std::string, std::string> artifacts;

    double computation_time_ms = 0.0;
    bool within_budget = true;
    std::vector<std::pair<std::string, double>> stage_timings_ms;
};

struct CycleResult {
    PerceptionState state;
    MetaPerceptionOutput output;
};

void to_json(nlohmann::json& j, const MetaPerceptionOutput& out);

class MetaPerceptionEngine {
public:
    // One perception cycle. Pure apart from the reported duration:
    // previous state in, new state and output back by value.
    static CycleResult step(const std::optional<PerceptionState>& previous,
                            const MetaPerceptionInput& input,
                            const PerceptionConfig& cfg);
};
