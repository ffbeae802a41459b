#include "decision.hpp"
#include "shocks.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

MetaPerceptionDecision DecisionMaker::decide(const PerceptionState& state,
                                             const std::vector<ShockEvent>& shocks,
                                             const RegimeAlert& regime,
                                             const std::string& snapshot_id,
                                             const PerceptionConfig& cfg) {
    MetaPerceptionDecision decision;
    decision.snapshot_id = snapshot_id;
    decision.ts_ms = state.ts_ms;
    decision.decision_id = make_decision_id(snapshot_id, state.ts_ms);

    size_t critical = ShockDetector::count_critical(shocks);

    decision.should_act = state.should_act;
    decision.confidence = stats::clamp(1.0 - state.total_uncertainty, 0.0, 1.0);
    decision.recommended_risk_mode = risk_mode(state, critical > 0);
    decision.leverage_adjustment = leverage_adjustment(state);

    decision.alert_operator = !state.should_act || critical > 0 ||
                              regime.alert_level == AlertLevel::Critical;
    if (!state.should_act) {
        decision.alert_priority = AlertPriority::Critical;
    } else if (decision.alert_operator) {
        decision.alert_priority = AlertPriority::High;
    } else {
        decision.alert_priority = AlertPriority::Low;
    }

    explain(state, critical, regime, cfg, decision);

    return decision;
}

RiskMode DecisionMaker::risk_mode(const PerceptionState& state, bool has_critical_shock) {
    if (state.regime_stress > 1.5 || has_critical_shock) return RiskMode::Defensive;
    if (state.noise_score > 0.6 || state.regime_stress > 0.8) return RiskMode::Cautious;
    return RiskMode::Normal;
}

std::optional<double> DecisionMaker::leverage_adjustment(const PerceptionState& state) {
    if (!state.should_act) return 0.5;
    if (state.total_uncertainty > 0.7) return 0.7;
    return std::nullopt;
}

std::string DecisionMaker::make_decision_id(const std::string& snapshot_id, int64_t ts_ms) {
    return "PD-" + util::hash_parts({snapshot_id, std::to_string(ts_ms)});
}

void DecisionMaker::explain(const PerceptionState& state,
                            size_t critical_shocks,
                            const RegimeAlert& regime,
                            const PerceptionConfig& cfg,
                            MetaPerceptionDecision& decision) {
    std::vector<std::string> reasons;
    auto& factors = decision.key_factors;

    if (state.noise_score >= cfg.noise_threshold) {
        reasons.push_back(fmt::format("noise {:.3f} >= threshold {:.3f}",
                                      state.noise_score, cfg.noise_threshold));
        factors.push_back(fmt::format("noise_score={:.3f}", state.noise_score));
    }
    if (state.total_uncertainty >= cfg.uncertainty_threshold) {
        reasons.push_back(fmt::format("uncertainty {:.3f} >= threshold {:.3f}",
                                      state.total_uncertainty, cfg.uncertainty_threshold));
        factors.push_back(fmt::format("total_uncertainty={:.3f}", state.total_uncertainty));
    }
    if (critical_shocks > 0) {
        reasons.push_back(fmt::format("{} critical shock(s) active", critical_shocks));
        factors.push_back(fmt::format("critical_shocks={}", critical_shocks));
    }
    if (regime.pivot_detected) {
        reasons.push_back(fmt::format("regime pivot detected (stress {:.3f}, p={:.3f}) toward {}",
                                      regime.stress, regime.pivot_probability,
                                      regime.expected_regime.value_or("UNKNOWN")));
        factors.push_back(fmt::format("regime_stress={:.3f}", regime.stress));
    }

    if (state.shock_intensity >= cfg.shock_intensity_threshold) {
        factors.push_back(fmt::format("shock_intensity={:.3f}", state.shock_intensity));
    }

    if (!state.should_act) {
        std::string rationale = "Action blocked: ";
        for (size_t i = 0; i < reasons.size(); i++) {
            if (i > 0) rationale += "; ";
            rationale += reasons[i];
        }
        if (reasons.empty()) {
            rationale += "perception guards not satisfied";
            factors.push_back("guards_failed");
        }
        decision.rationale = rationale;
        return;
    }

    decision.rationale = fmt::format(
        "Perception nominal: noise {:.3f}, uncertainty {:.3f}, regime stress {:.3f}, {} active shock(s)",
        state.noise_score, state.total_uncertainty, state.regime_stress, state.active_shocks.size());
    factors.push_back(fmt::format("pressure={}", to_string(state.dominant_pressure)));
    factors.push_back(fmt::format("confidence={:.3f}", decision.confidence));
}
