#pragma once

#include "state.hpp"

// Immutable bundle of one cycle's state plus every component output
struct PerceptionSnapshot {
    std::string snapshot_id;
    int64_t ts_ms = 0;
    std::string engine_version;

    PerceptionState state;

    EntropyMetrics entropy;
    NoiseScore noise;
    IntentScore intent;
    ReflexivityScore reflexivity;
    std::vector<ShockEvent> shocks;  // resolved shocks included for audit
    RegimeAlert regime;
    UncertaintyBreakdown uncertainty;

    double computation_time_ms = 0.0;
    std::string lineage_hash;
};

class SnapshotBuilder {
public:
    static std::string make_snapshot_id(int64_t ts_ms);

    // Chains the new state onto the previous one; GENESIS on the first cycle
    static std::string lineage_hash(const std::optional<PerceptionState>& previous,
                                    const PerceptionState& current);
};
