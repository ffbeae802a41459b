#include "state.hpp"
#include "reflexivity.hpp"
#include "shocks.hpp"
#include <spdlog/spdlog.h>

PerceptionState StateComposer::compose(const std::optional<PerceptionState>& previous,
                                       int64_t ts_ms,
                                       const EntropyMetrics& entropy,
                                       const NoiseScore& noise,
                                       const IntentScore& intent,
                                       const ReflexivityScore& reflexivity,
                                       const std::vector<ShockEvent>& shocks,
                                       const RegimeAlert& regime,
                                       const UncertaintyBreakdown& uncertainty,
                                       const PerceptionConfig& cfg) {
    PerceptionState state;
    state.ts_ms = ts_ms;

    state.market_entropy = entropy.market_entropy;
    state.feature_entropy = entropy.feature_entropy;

    state.noise_score = noise.noise_level;
    state.signal_quality = noise.signal_quality;

    state.participant_intent = intent.probabilities;
    state.dominant_pressure = pressure_from(intent);

    state.reflexivity_coefficient = reflexivity.coefficient;
    state.system_impact_score = reflexivity.market_impact_bps / ReflexivityAnalyzer::kMaxImpactBps;

    // Regime label carries over unless a pivot names a new one
    if (regime.pivot_detected && regime.expected_regime) {
        state.current_regime = regime.expected_regime;
        state.regime_confidence = regime.pivot_probability;
    } else {
        state.current_regime = previous ? previous->current_regime : regime.current_regime;
        state.regime_confidence = 1.0 - regime.pivot_probability;
    }
    state.regime_stress = regime.stress;
    state.regime_pivot_probability = regime.pivot_probability;

    // Resolved shocks stay in the snapshot's shock list for audit only
    for (const auto& s : shocks) {
        if (s.resolved) continue;
        state.active_shocks.insert(s.shock_id);
        state.shock_intensity += s.intensity;
    }
    state.active_critical_shocks = ShockDetector::count_critical(shocks);

    state.total_uncertainty = uncertainty.total;

    auto guards = evaluate_guards(noise, uncertainty.total, regime, shocks, cfg);
    state.should_act = guards.all();

    spdlog::debug("Guards: noise={} uncertainty={} pivot={} critical={}",
                  guards.noise_acceptable, guards.uncertainty_ok,
                  !guards.no_regime_pivot, !guards.no_critical_shocks);

    return state;
}

ActionGuards StateComposer::evaluate_guards(const NoiseScore& noise,
                                            double total_uncertainty,
                                            const RegimeAlert& regime,
                                            const std::vector<ShockEvent>& shocks,
                                            const PerceptionConfig& cfg) {
    ActionGuards guards;
    guards.noise_acceptable = noise.is_acceptable && noise.noise_level < cfg.noise_threshold;
    guards.uncertainty_ok = total_uncertainty < cfg.uncertainty_threshold;
    guards.no_regime_pivot = !regime.pivot_detected;
    guards.no_critical_shocks = ShockDetector::count_critical(shocks) == 0;
    return guards;
}

ActionGuards StateComposer::guards_for(const PerceptionState& state, const PerceptionConfig& cfg) {
    ActionGuards guards;
    guards.noise_acceptable = state.noise_score < cfg.noise_threshold;
    guards.uncertainty_ok = state.total_uncertainty < cfg.uncertainty_threshold;
    guards.no_regime_pivot = state.regime_stress < cfg.regime_stress_threshold;
    guards.no_critical_shocks = state.active_critical_shocks == 0;
    return guards;
}

MarketPressure StateComposer::pressure_from(const IntentScore& intent) {
    if (intent.intent_strength < kMinPressureProbability) return MarketPressure::Unknown;

    switch (intent.dominant_intent) {
        case Intent::Long: return MarketPressure::Long;
        case Intent::Short: return MarketPressure::Short;
        case Intent::Neutral: return MarketPressure::Neutral;
    }
    return MarketPressure::Unknown;
}
