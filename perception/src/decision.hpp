#pragma once

#include "state.hpp"

struct MetaPerceptionDecision {
    std::string decision_id;
    std::string snapshot_id;
    int64_t ts_ms = 0;

    bool should_act = false;
    double confidence = 0.0;
    RiskMode recommended_risk_mode = RiskMode::Normal;
    std::optional<double> leverage_adjustment;  // unset = no override

    bool alert_operator = false;
    AlertPriority alert_priority = AlertPriority::Low;

    std::string rationale;
    std::vector<std::string> key_factors;
};

class DecisionMaker {
public:
    static MetaPerceptionDecision decide(const PerceptionState& state,
                                         const std::vector<ShockEvent>& shocks,
                                         const RegimeAlert& regime,
                                         const std::string& snapshot_id,
                                         const PerceptionConfig& cfg);

    static RiskMode risk_mode(const PerceptionState& state, bool has_critical_shock);
    static std::optional<double> leverage_adjustment(const PerceptionState& state);
    static std::string make_decision_id(const std::string& snapshot_id, int64_t ts_ms);

private:
    static void explain(const PerceptionState& state,
                        size_t critical_shocks,
                        const RegimeAlert& regime,
                        const PerceptionConfig& cfg,
                        MetaPerceptionDecision& decision);
};
