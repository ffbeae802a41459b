#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/noise.hpp"

using Catch::Approx;

namespace {
std::vector<double> alternating(size_t n) {
    std::vector<double> xs;
    for (size_t i = 0; i < n; i++) {
        xs.push_back(i % 2 == 0 ? 100.0 : 110.0);
    }
    return xs;
}

std::vector<double> linear(size_t n) {
    std::vector<double> xs;
    for (size_t i = 0; i < n; i++) {
        xs.push_back(100.0 + 0.5 * i);
    }
    return xs;
}
}

TEST_CASE("Noise evaluation", "[noise]") {
    PerceptionConfig cfg;

    SECTION("Clean trend has no noise") {
        auto n = NoiseEvaluator::evaluate({{"price", linear(30)}}, cfg);

        REQUIRE(n.noise_level < 1e-9);
        REQUIRE(n.signal_quality == Approx(1.0));
        REQUIRE(n.interpretation == NoiseLevel::Clean);
        REQUIRE(n.is_acceptable);
    }

    SECTION("Oscillation around a flat trend is mostly noise") {
        // MA(5) alternates 104/106, residual alternates -4/+4: ratio 16
        auto n = NoiseEvaluator::evaluate({{"price", alternating(30)}}, cfg);

        REQUIRE(n.noise_level == Approx(16.0 / 17.0));
        REQUIRE(n.signal_quality == Approx(1.0 / 17.0));
        REQUIRE(n.interpretation == NoiseLevel::ExtremeNoise);
        REQUIRE_FALSE(n.is_acceptable);
    }

    SECTION("Constant series is noiseless") {
        auto n = NoiseEvaluator::evaluate({{"price", std::vector<double>(20, 7.0)}}, cfg);
        REQUIRE(n.noise_level == 0.0);
    }

    SECTION("Series shorter than the window are skipped") {
        auto n = NoiseEvaluator::evaluate({{"price", {1.0, 2.0, 3.0}}}, cfg);

        REQUIRE(n.feature_noise.empty());
        REQUIRE(n.noise_level == 0.0);
        REQUIRE(n.is_acceptable);
    }

    SECTION("Features are averaged") {
        auto n = NoiseEvaluator::evaluate({{"a", linear(30)}, {"b", alternating(30)}}, cfg);

        REQUIRE(n.feature_noise.size() == 2);
        REQUIRE(n.noise_level == Approx(8.0 / 17.0).margin(1e-9));
        REQUIRE(n.interpretation == NoiseLevel::Normal);
        REQUIRE(n.is_acceptable);
    }

    SECTION("Threshold gates acceptability") {
        cfg.noise_threshold = 0.3;
        auto n = NoiseEvaluator::evaluate({{"a", linear(30)}, {"b", alternating(30)}}, cfg);

        REQUIRE_FALSE(n.is_acceptable);
        REQUIRE(n.threshold == 0.3);
    }
}

TEST_CASE("Noise interpretation bands", "[noise]") {
    REQUIRE(NoiseEvaluator::classify(0.1) == NoiseLevel::Clean);
    REQUIRE(NoiseEvaluator::classify(0.3) == NoiseLevel::Normal);
    REQUIRE(NoiseEvaluator::classify(0.5) == NoiseLevel::Noisy);
    REQUIRE(NoiseEvaluator::classify(0.7) == NoiseLevel::ExtremeNoise);
}
