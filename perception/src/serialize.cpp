#include "serialize.hpp"
#include "util.hpp"

namespace {
template <typename T>
nlohmann::json opt(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}
}

void to_json(nlohmann::json& j, const IntentProbabilities& p) {
    j = {
        {"LONG", p.p_long},
        {"SHORT", p.p_short},
        {"NEUTRAL", p.p_neutral}
    };
}

void to_json(nlohmann::json& j, const EntropyMetrics& m) {
    j = {
        {"market_entropy", m.market_entropy},
        {"feature_entropy", m.feature_entropy},
        {"sample_counts", m.sample_counts},
        {"interpretation", to_string(m.interpretation)},
        {"bins", m.bins}
    };
}

void to_json(nlohmann::json& j, const NoiseScore& n) {
    j = {
        {"noise_level", n.noise_level},
        {"signal_quality", n.signal_quality},
        {"feature_noise", n.feature_noise},
        {"interpretation", to_string(n.interpretation)},
        {"is_acceptable", n.is_acceptable},
        {"threshold", n.threshold},
        {"window", n.window}
    };
}

void to_json(nlohmann::json& j, const IntentFeatures& f) {
    j = {
        {"open_interest_change", f.oi_change},
        {"funding_rate", f.funding_rate},
        {"whale_net_flow", f.whale_flow},
        {"futures_basis", f.basis},
        {"put_call_ratio", f.put_call}
    };
}

void to_json(nlohmann::json& j, const IntentScore& s) {
    j = {
        {"probabilities", s.probabilities},
        {"dominant_intent", to_string(s.dominant_intent)},
        {"intent_strength", s.intent_strength},
        {"participant_type", to_string(s.participant_type)},
        {"raw_features", s.raw},
        {"scaled_features", s.scaled},
        {"logits", {
            {"LONG", s.logit_long},
            {"SHORT", s.logit_short},
            {"NEUTRAL", s.logit_neutral}
        }}
    };
}

void to_json(nlohmann::json& j, const ReflexivityScore& r) {
    j = {
        {"coefficient", r.coefficient},
        {"market_impact_bps", r.market_impact_bps},
        {"feedback_strength", to_string(r.feedback_strength)},
        {"sample_size", r.sample_size},
        {"decision_vector", r.decision_vector},
        {"return_vector", r.return_vector}
    };
}

void to_json(nlohmann::json& j, const ShockEvent& e) {
    j = {
        {"shock_id", e.shock_id},
        {"feature", e.feature},
        {"index", e.index},
        {"observed_ts_ms", e.observed_ts_ms},
        {"value", e.value},
        {"mean", e.mean},
        {"stddev", e.stddev},
        {"z_score", e.z_score},
        {"intensity", e.intensity},
        {"severity", to_string(e.severity)},
        {"shock_type", to_string(e.shock_type)},
        {"expected_direction", to_string(e.expected_direction)},
        {"resolved", e.resolved},
        {"detected_ts_ms", e.detected_ts_ms}
    };
}

void to_json(nlohmann::json& j, const RegimeIndicators& x) {
    j = {
        {"volatility_acceleration", x.volatility_acceleration},
        {"correlation_instability", x.correlation_instability},
        {"liquidity_stress", x.liquidity_stress},
        {"flow_divergence", x.flow_divergence},
        {"entropy_spike", x.entropy_spike}
    };
}

void to_json(nlohmann::json& j, const RegimeAlert& a) {
    j = {
        {"indicators", a.indicators},
        {"stress", a.stress},
        {"threshold", a.threshold},
        {"pivot_probability", a.pivot_probability},
        {"pivot_detected", a.pivot_detected},
        {"alert_level", to_string(a.alert_level)},
        {"current_regime", opt(a.current_regime)},
        {"expected_regime", opt(a.expected_regime)}
    };
}

void to_json(nlohmann::json& j, const UncertaintyBreakdown& u) {
    j = {
        {"entropy", u.entropy_component},
        {"noise", u.noise_component},
        {"reflexivity", u.reflexivity_component},
        {"regime", u.regime_component},
        {"total", u.total}
    };
}

void to_json(nlohmann::json& j, const PerceptionState& s) {
    j = {
        {"ts_ms", s.ts_ms},
        {"market_entropy", s.market_entropy},
        {"feature_entropy", s.feature_entropy},
        {"noise_score", s.noise_score},
        {"signal_quality", s.signal_quality},
        {"participant_intent", s.participant_intent},
        {"dominant_pressure", to_string(s.dominant_pressure)},
        {"reflexivity_coefficient", s.reflexivity_coefficient},
        {"system_impact_score", s.system_impact_score},
        {"current_regime", opt(s.current_regime)},
        {"regime_confidence", s.regime_confidence},
        {"regime_stress", s.regime_stress},
        {"regime_pivot_probability", s.regime_pivot_probability},
        {"active_shocks", s.active_shocks},
        {"active_critical_shocks", s.active_critical_shocks},
        {"shock_intensity", s.shock_intensity},
        {"total_uncertainty", s.total_uncertainty},
        {"should_act", s.should_act}
    };
}

void to_json(nlohmann::json& j, const PerceptionSnapshot& s) {
    j = {
        {"snapshot_id", s.snapshot_id},
        {"ts_ms", s.ts_ms},
        {"timestamp", util::format_iso8601(s.ts_ms)},
        {"engine_version", s.engine_version},
        {"state", s.state},
        {"entropy", s.entropy},
        {"noise", s.noise},
        {"intent", s.intent},
        {"reflexivity", s.reflexivity},
        {"shocks", s.shocks},
        {"regime", s.regime},
        {"uncertainty", s.uncertainty},
        {"computation_time_ms", s.computation_time_ms},
        {"lineage_hash", s.lineage_hash}
    };
}

void to_json(nlohmann::json& j, const PerceptionDelta& d) {
    j = {
        {"ts_ms", d.ts_ms},
        {"previous_ts_ms", d.previous_ts_ms},
        {"entropy_delta", d.entropy_delta},
        {"noise_delta", d.noise_delta},
        {"reflexivity_delta", d.reflexivity_delta},
        {"intent_shift", {
            {"LONG", d.intent_shift.long_shift},
            {"SHORT", d.intent_shift.short_shift},
            {"NEUTRAL", d.intent_shift.neutral_shift}
        }},
        {"regime_changed", d.regime_changed},
        {"previous_regime", opt(d.previous_regime)},
        {"current_regime", opt(d.current_regime)},
        {"shocks_added", d.shocks_added},
        {"shocks_resolved", d.shocks_resolved},
        {"alert_priority", to_string(d.alert_priority)}
    };
}

void to_json(nlohmann::json& j, const MetaPerceptionDecision& d) {
    j = {
        {"decision_id", d.decision_id},
        {"snapshot_id", d.snapshot_id},
        {"ts_ms", d.ts_ms},
        {"should_act", d.should_act},
        {"confidence", d.confidence},
        {"recommended_risk_mode", to_string(d.recommended_risk_mode)},
        {"leverage_adjustment", opt(d.leverage_adjustment)},
        {"alert_operator", d.alert_operator},
        {"alert_priority", to_string(d.alert_priority)},
        {"rationale", d.rationale},
        {"key_factors", d.key_factors}
    };
}

void to_json(nlohmann::json& j, const OverrideRecord& r) {
    j = {
        {"override_id", r.override_id},
        {"decision_id", r.decision_id},
        {"snapshot_id", r.snapshot_id},
        {"ts_ms", r.ts_ms},
        {"trigger", to_string(r.trigger)},
        {"trigger_value", r.trigger_value},
        {"trigger_threshold", r.trigger_threshold},
        {"estimated_trades_prevented", r.estimated_trades_prevented},
        {"estimated_capital_prevented", r.estimated_capital_prevented},
        {"rationale", r.rationale}
    };
}
