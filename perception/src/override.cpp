#include "override.hpp"
#include "shocks.hpp"
#include "util.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

const char* to_string(OverrideTrigger v) {
    switch (v) {
        case OverrideTrigger::HighNoise: return "HIGH_NOISE";
        case OverrideTrigger::HighUncertainty: return "HIGH_UNCERTAINTY";
        case OverrideTrigger::RegimePivot: return "REGIME_PIVOT";
        case OverrideTrigger::CriticalShock: return "CRITICAL_SHOCK";
        case OverrideTrigger::LowConfidence: return "LOW_CONFIDENCE";
    }
    return "UNKNOWN";
}

std::optional<OverrideRecord> OverrideDetector::detect(const MetaPerceptionDecision& decision,
                                                       const PerceptionSnapshot& snapshot,
                                                       const MetaPerceptionInput& input,
                                                       const PerceptionConfig& cfg) {
    if (decision.should_act) return std::nullopt;

    OverrideRecord rec;
    rec.decision_id = decision.decision_id;
    rec.snapshot_id = snapshot.snapshot_id;
    rec.ts_ms = decision.ts_ms;
    rec.trigger = classify(snapshot, cfg, rec.trigger_value, rec.trigger_threshold);
    rec.override_id = "OV-" + util::hash_parts({decision.decision_id, to_string(rec.trigger)});
    rec.rationale = decision.rationale;

    // Portfolio context wins when it holds a usable count; otherwise count
    // directional decisions in the window
    const auto& ctx = input.portfolio_context;
    if (auto pending = pending_trades(ctx)) {
        rec.estimated_trades_prevented = *pending;
    } else {
        size_t window = std::min(input.prior_decisions.size(),
                                 static_cast<size_t>(cfg.reflexivity_window));
        rec.estimated_trades_prevented = static_cast<int>(std::count_if(
            input.prior_decisions.end() - window, input.prior_decisions.end(),
            [](const PriorDecision& d) { return d.direction() != 0.0; }));
    }
    if (ctx.is_object() && ctx.contains("pending_notional") && ctx["pending_notional"].is_number()) {
        rec.estimated_capital_prevented = ctx["pending_notional"].get<double>();
    }

    spdlog::warn("Override {}: {} ({:.3f} vs {:.3f}), {} trade(s) prevented",
                 rec.override_id, to_string(rec.trigger), rec.trigger_value,
                 rec.trigger_threshold, rec.estimated_trades_prevented);

    return rec;
}

std::optional<int> OverrideDetector::pending_trades(const nlohmann::json& portfolio_context) {
    if (!portfolio_context.is_object()) return std::nullopt;

    auto it = portfolio_context.find("pending_trades");
    if (it == portfolio_context.end() || !it->is_number_integer()) return std::nullopt;

    if (it->is_number_unsigned()) {
        auto n = it->get<uint64_t>();
        if (n > static_cast<uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
        return static_cast<int>(n);
    }

    auto n = it->get<int64_t>();
    if (n < 0 || n > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(n);
}

OverrideTrigger OverrideDetector::classify(const PerceptionSnapshot& snapshot,
                                           const PerceptionConfig& cfg,
                                           double& value,
                                           double& threshold) {
    const auto& state = snapshot.state;

    if (!snapshot.noise.is_acceptable || state.noise_score >= cfg.noise_threshold) {
        value = state.noise_score;
        threshold = cfg.noise_threshold;
        return OverrideTrigger::HighNoise;
    }
    if (state.total_uncertainty >= cfg.uncertainty_threshold) {
        value = state.total_uncertainty;
        threshold = cfg.uncertainty_threshold;
        return OverrideTrigger::HighUncertainty;
    }
    if (snapshot.regime.pivot_detected) {
        value = snapshot.regime.stress;
        threshold = cfg.regime_stress_threshold;
        return OverrideTrigger::RegimePivot;
    }
    size_t critical = ShockDetector::count_critical(snapshot.shocks);
    if (critical > 0) {
        value = static_cast<double>(critical);
        threshold = 0.0;
        return OverrideTrigger::CriticalShock;
    }

    value = 1.0 - state.total_uncertainty;
    threshold = 1.0 - cfg.uncertainty_threshold;
    return OverrideTrigger::LowConfidence;
}
