#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/decision.hpp"
#include <algorithm>

using Catch::Approx;

namespace {
PerceptionState nominal_state() {
    PerceptionState s;
    s.ts_ms = 1700000000000;
    s.noise_score = 0.2;
    s.regime_stress = 0.1;
    s.total_uncertainty = 0.3;
    s.dominant_pressure = MarketPressure::Long;
    s.should_act = true;
    return s;
}

bool has_factor(const MetaPerceptionDecision& d, const std::string& factor) {
    return std::find(d.key_factors.begin(), d.key_factors.end(), factor) != d.key_factors.end();
}
}

TEST_CASE("Decision from a nominal state", "[decision]") {
    PerceptionConfig cfg;
    auto d = DecisionMaker::decide(nominal_state(), {}, RegimeAlert(), "PS-1700000000000", cfg);

    REQUIRE(d.should_act);
    REQUIRE(d.confidence == Approx(0.7));
    REQUIRE(d.recommended_risk_mode == RiskMode::Normal);
    REQUIRE_FALSE(d.leverage_adjustment.has_value());
    REQUIRE_FALSE(d.alert_operator);
    REQUIRE(d.alert_priority == AlertPriority::Low);
    REQUIRE(d.snapshot_id == "PS-1700000000000");
    REQUIRE(d.ts_ms == 1700000000000);
    REQUIRE(d.rationale.rfind("Perception nominal", 0) == 0);
    REQUIRE(has_factor(d, "pressure=LONG"));
    REQUIRE(has_factor(d, "confidence=0.700"));
}

TEST_CASE("Blocked decisions", "[decision]") {
    PerceptionConfig cfg;
    auto state = nominal_state();

    SECTION("High noise") {
        state.noise_score = 0.75;
        state.should_act = false;

        auto d = DecisionMaker::decide(state, {}, RegimeAlert(), "PS-1", cfg);

        REQUIRE_FALSE(d.should_act);
        REQUIRE(d.recommended_risk_mode == RiskMode::Cautious);
        REQUIRE(d.leverage_adjustment == 0.5);
        REQUIRE(d.alert_operator);
        REQUIRE(d.alert_priority == AlertPriority::Critical);
        REQUIRE(d.rationale == "Action blocked: noise 0.750 >= threshold 0.700");
        REQUIRE(has_factor(d, "noise_score=0.750"));
    }

    SECTION("Reasons keep guard order") {
        state.noise_score = 0.8;
        state.total_uncertainty = 0.9;
        state.should_act = false;
        RegimeAlert regime;
        regime.pivot_detected = true;
        regime.stress = 1.4;
        regime.expected_regime = "BEAR";

        auto d = DecisionMaker::decide(state, {}, regime, "PS-1", cfg);

        auto noise_at = d.rationale.find("noise 0.800");
        auto uncertainty_at = d.rationale.find("uncertainty 0.900");
        auto pivot_at = d.rationale.find("regime pivot");
        REQUIRE(noise_at != std::string::npos);
        REQUIRE(uncertainty_at != std::string::npos);
        REQUIRE(pivot_at != std::string::npos);
        REQUIRE(noise_at < uncertainty_at);
        REQUIRE(uncertainty_at < pivot_at);
        REQUIRE(d.rationale.find("BEAR") != std::string::npos);
        REQUIRE(d.confidence == Approx(0.1));
    }

    SECTION("Active critical shock") {
        ShockEvent shock;
        shock.shock_id = "price@1700000000000";
        shock.severity = ShockSeverity::Critical;
        state.should_act = false;

        auto d = DecisionMaker::decide(state, {shock}, RegimeAlert(), "PS-1", cfg);

        REQUIRE(d.recommended_risk_mode == RiskMode::Defensive);
        REQUIRE(has_factor(d, "critical_shocks=1"));
        REQUIRE(d.rationale.find("1 critical shock(s) active") != std::string::npos);
    }

    SECTION("No explicit reason falls back to guards_failed") {
        state.should_act = false;

        auto d = DecisionMaker::decide(state, {}, RegimeAlert(), "PS-1", cfg);

        REQUIRE(d.rationale == "Action blocked: perception guards not satisfied");
        REQUIRE(has_factor(d, "guards_failed"));
    }
}

TEST_CASE("Risk posture and leverage", "[decision]") {
    auto state = nominal_state();

    SECTION("Stress above 1.5 is defensive") {
        state.regime_stress = 1.6;
        REQUIRE(DecisionMaker::risk_mode(state, false) == RiskMode::Defensive);
    }

    SECTION("Moderate stress or noise is cautious") {
        state.regime_stress = 0.9;
        REQUIRE(DecisionMaker::risk_mode(state, false) == RiskMode::Cautious);
        state.regime_stress = 0.1;
        state.noise_score = 0.65;
        REQUIRE(DecisionMaker::risk_mode(state, false) == RiskMode::Cautious);
    }

    SECTION("Critical shock is defensive regardless of stress") {
        REQUIRE(DecisionMaker::risk_mode(state, true) == RiskMode::Defensive);
    }

    SECTION("Elevated uncertainty trims leverage while acting") {
        state.total_uncertainty = 0.75;
        REQUIRE(DecisionMaker::leverage_adjustment(state) == 0.7);
    }
}

TEST_CASE("Critical regime alert while acting", "[decision]") {
    PerceptionConfig cfg;
    cfg.regime_stress_threshold = 3.0;
    RegimeAlert regime;
    regime.stress = 2.2;
    regime.alert_level = AlertLevel::Critical;

    auto d = DecisionMaker::decide(nominal_state(), {}, regime, "PS-1", cfg);

    REQUIRE(d.should_act);
    REQUIRE(d.alert_operator);
    REQUIRE(d.alert_priority == AlertPriority::High);
}

TEST_CASE("Decision ids are deterministic", "[decision]") {
    auto a = DecisionMaker::make_decision_id("PS-100", 100);
    auto b = DecisionMaker::make_decision_id("PS-100", 100);
    auto c = DecisionMaker::make_decision_id("PS-101", 101);

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a.rfind("PD-", 0) == 0);
}
