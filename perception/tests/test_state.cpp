#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/state.hpp"
#include "../src/intent.hpp"

using Catch::Approx;

namespace {
constexpr int64_t kTs = 1700000000000;

// Component outputs for a quiet, healthy market
struct Components {
    EntropyMetrics entropy;
    NoiseScore noise;
    IntentScore intent;
    ReflexivityScore reflexivity;
    std::vector<ShockEvent> shocks;
    RegimeAlert regime;
    UncertaintyBreakdown uncertainty;

    Components() {
        entropy.market_entropy = 2.0;
        entropy.feature_entropy["price"] = 2.0;
        noise.noise_level = 0.2;
        noise.signal_quality = 0.8;
        noise.is_acceptable = true;
        intent = IntentInferencer::infer(std::map<std::string, double>{});
        reflexivity.market_impact_bps = 2.5;
        reflexivity.coefficient = 0.25;
        regime.stress = 0.1;
        regime.pivot_probability = 0.01;
        uncertainty.total = 0.3;
    }

    PerceptionState compose(const std::optional<PerceptionState>& previous = std::nullopt,
                            const PerceptionConfig& cfg = PerceptionConfig()) const {
        return StateComposer::compose(previous, kTs, entropy, noise, intent, reflexivity,
                                      shocks, regime, uncertainty, cfg);
    }
};

ShockEvent shock(const std::string& id, ShockSeverity severity, double intensity, bool resolved) {
    ShockEvent s;
    s.shock_id = id;
    s.severity = severity;
    s.intensity = intensity;
    s.resolved = resolved;
    return s;
}
}

TEST_CASE("State composition", "[state]") {
    Components c;

    SECTION("Healthy components allow action") {
        auto s = c.compose();

        REQUIRE(s.should_act);
        REQUIRE(s.ts_ms == kTs);
        REQUIRE(s.market_entropy == 2.0);
        REQUIRE(s.noise_score == 0.2);
        REQUIRE(s.signal_quality == 0.8);
        REQUIRE(s.system_impact_score == Approx(0.5));
        REQUIRE(s.dominant_pressure == MarketPressure::Neutral);
        REQUIRE(s.participant_intent.sum() == Approx(1.0));
        REQUIRE(s.regime_confidence == Approx(0.99));
        REQUIRE(s.active_shocks.empty());
    }

    SECTION("Noise at or above threshold always blocks") {
        PerceptionConfig cfg;
        for (double level : {cfg.noise_threshold, 0.85, 1.0}) {
            c.noise.noise_level = level;
            c.noise.is_acceptable = false;
            auto s = c.compose(std::nullopt, cfg);

            REQUIRE_FALSE(s.should_act);
        }
    }

    SECTION("Uncertainty at threshold blocks") {
        c.uncertainty.total = PerceptionConfig().uncertainty_threshold;
        REQUIRE_FALSE(c.compose().should_act);
    }

    SECTION("Regime pivot blocks and names the new regime") {
        c.regime.pivot_detected = true;
        c.regime.pivot_probability = 0.9;
        c.regime.expected_regime = "CRISIS";

        auto s = c.compose();

        REQUIRE_FALSE(s.should_act);
        REQUIRE(s.current_regime == std::string("CRISIS"));
        REQUIRE(s.regime_confidence == Approx(0.9));
    }

    SECTION("Regime label carries over without a pivot") {
        PerceptionState previous;
        previous.current_regime = "BULL";

        auto s = c.compose(previous);

        REQUIRE(s.current_regime == std::string("BULL"));
    }

    SECTION("Active critical shock blocks") {
        c.shocks.push_back(shock("price@1700000000000", ShockSeverity::Critical, 5.5, false));

        auto s = c.compose();

        REQUIRE_FALSE(s.should_act);
        REQUIRE(s.active_shocks.count("price@1700000000000") == 1);
        REQUIRE(s.active_critical_shocks == 1);
        REQUIRE(s.shock_intensity == Approx(5.5));
    }

    SECTION("Resolved shocks are audit-only") {
        c.shocks.push_back(shock("price@1699997640000", ShockSeverity::Critical, 6.0, true));
        c.shocks.push_back(shock("funding@1700000000000", ShockSeverity::Medium, 1.2, false));

        auto s = c.compose();

        REQUIRE(s.should_act);
        REQUIRE(s.active_critical_shocks == 0);
        REQUIRE(s.active_shocks.size() == 1);
        REQUIRE(s.active_shocks.count("funding@1700000000000") == 1);
        REQUIRE(s.shock_intensity == Approx(1.2));
    }
}

TEST_CASE("Guards can be re-derived from the state", "[state]") {
    PerceptionConfig cfg;
    Components c;

    SECTION("Healthy") {
        auto s = c.compose();
        REQUIRE(StateComposer::guards_for(s, cfg).all() == s.should_act);
    }

    SECTION("Noisy") {
        c.noise.noise_level = 0.9;
        c.noise.is_acceptable = false;
        auto s = c.compose();
        auto guards = StateComposer::guards_for(s, cfg);

        REQUIRE_FALSE(guards.noise_acceptable);
        REQUIRE(guards.all() == s.should_act);
    }

    SECTION("Pivot") {
        c.regime.stress = 1.2;
        c.regime.pivot_detected = true;
        c.regime.pivot_probability = 0.73;
        c.regime.expected_regime = "BEAR";
        auto s = c.compose();
        auto guards = StateComposer::guards_for(s, cfg);

        REQUIRE_FALSE(guards.no_regime_pivot);
        REQUIRE(guards.all() == s.should_act);
    }

    SECTION("Active critical shock") {
        c.shocks.push_back(shock("oi@1700000000000", ShockSeverity::Critical, 5.2, false));
        auto s = c.compose();
        auto guards = StateComposer::guards_for(s, cfg);

        REQUIRE_FALSE(guards.no_critical_shocks);
        REQUIRE(guards.all() == s.should_act);
        REQUIRE_FALSE(s.should_act);
    }
}

TEST_CASE("Market pressure", "[state]") {
    IntentScore intent;
    intent.dominant_intent = Intent::Long;

    intent.intent_strength = 0.38;
    REQUIRE(StateComposer::pressure_from(intent) == MarketPressure::Unknown);

    intent.intent_strength = 0.6;
    REQUIRE(StateComposer::pressure_from(intent) == MarketPressure::Long);

    intent.dominant_intent = Intent::Short;
    REQUIRE(StateComposer::pressure_from(intent) == MarketPressure::Short);
}
