#pragma once

#include "state.hpp"

struct IntentShift {
    double long_shift = 0.0;
    double short_shift = 0.0;
    double neutral_shift = 0.0;
};

// Signed change between two consecutive states
struct PerceptionDelta {
    int64_t ts_ms = 0;
    int64_t previous_ts_ms = 0;

    double entropy_delta = 0.0;
    double noise_delta = 0.0;
    double reflexivity_delta = 0.0;
    IntentShift intent_shift;

    bool regime_changed = false;
    std::optional<std::string> previous_regime;
    std::optional<std::string> current_regime;

    std::vector<ShockEvent> shocks_added;   // newly active events
    std::set<std::string> shocks_resolved;  // ids active before, gone now

    AlertPriority alert_priority = AlertPriority::Low;
};

class DeltaComputer {
public:
    static PerceptionDelta compute(const PerceptionState& previous,
                                   const PerceptionState& current,
                                   const std::vector<ShockEvent>& current_shocks);

    // First cycle has no delta
    static std::optional<PerceptionDelta> compute(const std::optional<PerceptionState>& previous,
                                                  const PerceptionState& current,
                                                  const std::vector<ShockEvent>& current_shocks);

    static AlertPriority derive_priority(const std::vector<ShockEvent>& shocks_added,
                                         bool regime_changed);
};
