#include "engine.hpp"
#include "entropy.hpp"
#include "intent.hpp"
#include "noise.hpp"
#include "profiler.hpp"
#include "reflexivity.hpp"
#include "regime.hpp"
#include "serialize.hpp"
#include "shocks.hpp"
#include "uncertainty.hpp"
#include <spdlog/spdlog.h>

CycleResult MetaPerceptionEngine::step(const std::optional<PerceptionState>& previous,
                                       const MetaPerceptionInput& input,
                                       const PerceptionConfig& cfg) {
    StageProfiler profiler(cfg.max_computation_time_ms);

    // Fixed order: each stage consumes only the outputs before it
    auto entropy = profiler.time("entropy", [&] {
        return EntropyEngine::compute_market_entropy(input.market_data, cfg);
    });
    auto noise = profiler.time("noise", [&] {
        return NoiseEvaluator::evaluate(input.market_data, cfg);
    });
    auto intent = profiler.time("intent", [&] {
        return IntentInferencer::infer(input.features);
    });
    auto reflexivity = profiler.time("reflexivity", [&] {
        static const std::vector<double> kNoPrices;
        auto it = input.market_data.find(cfg.reflexivity_price_feature);
        const auto& prices = it != input.market_data.end() ? it->second : kNoPrices;
        return ReflexivityAnalyzer::analyze(input.prior_decisions, prices, cfg);
    });
    auto shocks = profiler.time("shocks", [&] {
        return ShockDetector::detect_shocks(input.market_data, input.ts_ms, cfg);
    });
    auto regime = profiler.time("regime", [&] {
        return RegimePivotDetector::assess(input.features, entropy.market_entropy, previous, cfg);
    });
    auto uncertainty = profiler.time("uncertainty", [&] {
        return UncertaintyAggregator::aggregate(entropy, noise, reflexivity, regime, cfg);
    });
    auto state = profiler.time("state", [&] {
        return StateComposer::compose(previous, input.ts_ms, entropy, noise, intent,
                                      reflexivity, shocks, regime, uncertainty, cfg);
    });
    auto delta = profiler.time("delta", [&] {
        return DeltaComputer::compute(previous, state, shocks);
    });

    std::string snapshot_id = SnapshotBuilder::make_snapshot_id(input.ts_ms);
    auto decision = profiler.time("decision", [&] {
        return DecisionMaker::decide(state, shocks, regime, snapshot_id, cfg);
    });

    CycleResult result;
    result.state = state;

    auto& out = result.output;
    auto& snap = out.snapshot;
    snap.snapshot_id = snapshot_id;
    snap.ts_ms = input.ts_ms;
    snap.engine_version = cfg.engine_version;
    snap.state = state;
    snap.entropy = std::move(entropy);
    snap.noise = std::move(noise);
    snap.intent = intent;
    snap.reflexivity = std::move(reflexivity);
    snap.shocks = std::move(shocks);
    snap.regime = regime;
    snap.uncertainty = uncertainty;
    snap.lineage_hash = SnapshotBuilder::lineage_hash(previous, state);

    out.delta = std::move(delta);
    out.decision = std::move(decision);
    out.override_record = OverrideDetector::detect(out.decision, snap, input, cfg);

    out.computation_time_ms = profiler.elapsed_ms();
    out.within_budget = profiler.within_budget(out.computation_time_ms);
    out.stage_timings_ms = profiler.stages();
    snap.computation_time_ms = out.computation_time_ms;

    if (!out.within_budget) {
        spdlog::warn("Perception cycle {} took {:.2f}ms (budget {:.2f}ms)",
                     snapshot_id, out.computation_time_ms, cfg.max_computation_time_ms);
    }

    spdlog::info("Cycle {}: should_act={} risk={} U={:.3f} noise={:.3f} stress={:.3f} shocks={} ({:.2f}ms)",
                 snapshot_id, state.should_act, to_string(out.decision.recommended_risk_mode),
                 state.total_uncertainty, state.noise_score, state.regime_stress,
                 state.active_shocks.size(), out.computation_time_ms);

    return result;
}

void to_json(nlohmann::json& j, const MetaPerceptionOutput& out) {
    nlohmann::json stages = nlohmann::json::object();
    for (const auto& [stage, ms] : out.stage_timings_ms) {
        stages[stage] = ms;
    }

    j = {
        {"snapshot", out.snapshot},
        {"delta", out.delta ? nlohmann::json(*out.delta) : nlohmann::json(nullptr)},
        {"decision", out.decision},
        {"override", out.override_record ? nlohmann::json(*out.override_record) : nlohmann::json(nullptr)},
        {"artifacts", out.artifacts},
        {"computation_time_ms", out.computation_time_ms},
        {"within_budget", out.within_budget},
        {"stage_timings_ms", stages}
    };
}
