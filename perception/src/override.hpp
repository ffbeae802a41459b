#pragma once

#include "decision.hpp"
#include "input.hpp"
#include "snapshot.hpp"

enum class OverrideTrigger { HighNoise, HighUncertainty, RegimePivot, CriticalShock, LowConfidence };

const char* to_string(OverrideTrigger v);

// What a blocking decision prevented, for the override log
struct OverrideRecord {
    std::string override_id;
    std::string decision_id;
    std::string snapshot_id;
    int64_t ts_ms = 0;

    OverrideTrigger trigger = OverrideTrigger::LowConfidence;
    double trigger_value = 0.0;
    double trigger_threshold = 0.0;

    int estimated_trades_prevented = 0;
    double estimated_capital_prevented = 0.0;

    std::string rationale;
};

class OverrideDetector {
public:
    // nullopt unless the decision blocks action
    static std::optional<OverrideRecord> detect(const MetaPerceptionDecision& decision,
                                                const PerceptionSnapshot& snapshot,
                                                const MetaPerceptionInput& input,
                                                const PerceptionConfig& cfg);

    // Non-negative integer pending_trades that fits an int, else nullopt
    static std::optional<int> pending_trades(const nlohmann::json& portfolio_context);

    // First failing guard in HIGH_NOISE, HIGH_UNCERTAINTY, REGIME_PIVOT, CRITICAL_SHOCK order
    static OverrideTrigger classify(const PerceptionSnapshot& snapshot,
                                    const PerceptionConfig& cfg,
                                    double& value,
                                    double& threshold);
};
