#include "delta.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

PerceptionDelta DeltaComputer::compute(const PerceptionState& previous,
                                       const PerceptionState& current,
                                       const std::vector<ShockEvent>& current_shocks) {
    PerceptionDelta delta;
    delta.ts_ms = current.ts_ms;
    delta.previous_ts_ms = previous.ts_ms;

    delta.entropy_delta = current.market_entropy - previous.market_entropy;
    delta.noise_delta = current.noise_score - previous.noise_score;
    delta.reflexivity_delta = current.reflexivity_coefficient - previous.reflexivity_coefficient;

    delta.intent_shift.long_shift = current.participant_intent.p_long - previous.participant_intent.p_long;
    delta.intent_shift.short_shift = current.participant_intent.p_short - previous.participant_intent.p_short;
    delta.intent_shift.neutral_shift = current.participant_intent.p_neutral - previous.participant_intent.p_neutral;

    delta.previous_regime = previous.current_regime;
    delta.current_regime = current.current_regime;
    delta.regime_changed = previous.current_regime != current.current_regime;

    std::set<std::string> added_ids;
    std::set_difference(current.active_shocks.begin(), current.active_shocks.end(),
                        previous.active_shocks.begin(), previous.active_shocks.end(),
                        std::inserter(added_ids, added_ids.end()));

    std::set_difference(previous.active_shocks.begin(), previous.active_shocks.end(),
                        current.active_shocks.begin(), current.active_shocks.end(),
                        std::inserter(delta.shocks_resolved, delta.shocks_resolved.end()));

    for (const auto& s : current_shocks) {
        if (added_ids.count(s.shock_id)) {
            delta.shocks_added.push_back(s);
        }
    }

    delta.alert_priority = derive_priority(delta.shocks_added, delta.regime_changed);

    spdlog::debug("Delta: +{} shocks, -{} resolved, regime_changed={}, priority={}",
                  delta.shocks_added.size(), delta.shocks_resolved.size(),
                  delta.regime_changed, to_string(delta.alert_priority));

    return delta;
}

std::optional<PerceptionDelta> DeltaComputer::compute(const std::optional<PerceptionState>& previous,
                                                      const PerceptionState& current,
                                                      const std::vector<ShockEvent>& current_shocks) {
    if (!previous) return std::nullopt;
    return compute(*previous, current, current_shocks);
}

AlertPriority DeltaComputer::derive_priority(const std::vector<ShockEvent>& shocks_added,
                                             bool regime_changed) {
    bool critical = std::any_of(shocks_added.begin(), shocks_added.end(),
                                [](const ShockEvent& s) {
                                    return s.severity == ShockSeverity::Critical;
                                });

    if (critical) return AlertPriority::Critical;
    if (regime_changed) return AlertPriority::High;
    if (!shocks_added.empty()) return AlertPriority::Medium;
    return AlertPriority::Low;
}
