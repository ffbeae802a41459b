#pragma once

#include "types.hpp"
#include "config.hpp"
#include <set>

// Canonical snapshot of "what the market feels like now".
// Built once per cycle by StateComposer and never mutated afterwards.
struct PerceptionState {
    int64_t ts_ms = 0;

    double market_entropy = 0.0;
    std::map<std::string, double> feature_entropy;

    double noise_score = 0.0;
    double signal_quality = 1.0;

    IntentProbabilities participant_intent;
    MarketPressure dominant_pressure = MarketPressure::Unknown;

    double reflexivity_coefficient = 0.0;
    double system_impact_score = 0.0;

    std::optional<std::string> current_regime;
    double regime_confidence = 0.0;
    double regime_stress = 0.0;
    double regime_pivot_probability = 0.0;

    std::set<std::string> active_shocks;
    size_t active_critical_shocks = 0;
    double shock_intensity = 0.0;

    double total_uncertainty = 0.0;

    bool should_act = false;
};

// Outcome of the four action guards; should_act is their conjunction
struct ActionGuards {
    bool noise_acceptable = false;
    bool uncertainty_ok = false;
    bool no_regime_pivot = false;
    bool no_critical_shocks = false;

    bool all() const {
        return noise_acceptable && uncertainty_ok && no_regime_pivot && no_critical_shocks;
    }
};

class StateComposer {
public:
    static PerceptionState compose(const std::optional<PerceptionState>& previous,
                                   int64_t ts_ms,
                                   const EntropyMetrics& entropy,
                                   const NoiseScore& noise,
                                   const IntentScore& intent,
                                   const ReflexivityScore& reflexivity,
                                   const std::vector<ShockEvent>& shocks,
                                   const RegimeAlert& regime,
                                   const UncertaintyBreakdown& uncertainty,
                                   const PerceptionConfig& cfg);

    static ActionGuards evaluate_guards(const NoiseScore& noise,
                                        double total_uncertainty,
                                        const RegimeAlert& regime,
                                        const std::vector<ShockEvent>& shocks,
                                        const PerceptionConfig& cfg);

    // Same guards re-derived from a composed state alone
    static ActionGuards guards_for(const PerceptionState& state, const PerceptionConfig& cfg);

    static MarketPressure pressure_from(const IntentScore& intent);

    // Minimum dominant probability before pressure is called
    static constexpr double kMinPressureProbability = 0.4;
};
