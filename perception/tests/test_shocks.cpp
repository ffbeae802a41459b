#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/shocks.hpp"

using Catch::Approx;

namespace {
constexpr int64_t kTs = 1700000000000;

std::vector<double> baseline(size_t n) {
    std::vector<double> xs;
    for (size_t i = 0; i < n; i++) {
        xs.push_back(i % 2 == 0 ? 1.0 : -1.0);
    }
    return xs;
}
}

TEST_CASE("Shock detection", "[shocks]") {
    PerceptionConfig cfg;

    SECTION("Larger outlier comes first") {
        auto series = baseline(100);
        series[20] = 12.0;  // z ~ 4.6
        series[70] = 20.0;  // z ~ 7.8

        auto shocks = ShockDetector::detect_shocks({{"whale_flow", series}}, kTs, cfg);

        REQUIRE(shocks.size() == 2);
        REQUIRE(shocks[0].index == 70);
        REQUIRE(shocks[1].index == 20);
        REQUIRE(shocks[0].intensity > shocks[1].intensity);
        REQUIRE(shocks[0].intensity == Approx(shocks[0].z_score / 3.0));
        REQUIRE(shocks[0].severity == ShockSeverity::High);
        REQUIRE(shocks[1].severity == ShockSeverity::Medium);
        REQUIRE(shocks[0].shock_type == ShockType::Flow);
        REQUIRE(shocks[0].expected_direction == PriceDirection::Up);
        REQUIRE(shocks[0].observed_ts_ms == kTs - 29 * 60000);
        REQUIRE(shocks[0].shock_id == "whale_flow@" + std::to_string(kTs - 29 * 60000));
        REQUIRE(shocks[0].detected_ts_ms == kTs);
    }

    SECTION("Shocks resolve once the feature reverts") {
        auto series = baseline(100);
        series[70] = 20.0;

        auto shocks = ShockDetector::detect_shocks({{"price", series}}, kTs, cfg);

        REQUIRE(shocks.size() == 1);
        REQUIRE(shocks[0].resolved);
    }

    SECTION("Latest-point shock stays active") {
        auto series = baseline(50);
        series.back() = -30.0;

        auto shocks = ShockDetector::detect_shocks({{"price", series}}, kTs, cfg);

        REQUIRE(shocks.size() == 1);
        REQUIRE_FALSE(shocks[0].resolved);
        REQUIRE(shocks[0].expected_direction == PriceDirection::Down);
    }

    SECTION("Short series are skipped") {
        auto series = baseline(9);
        series[4] = 500.0;

        REQUIRE(ShockDetector::detect_shocks({{"price", series}}, kTs, cfg).empty());
    }

    SECTION("Zero-variance series have no shocks") {
        REQUIRE(ShockDetector::detect_shocks({{"price", std::vector<double>(40, 3.0)}}, kTs, cfg).empty());
    }

    SECTION("Simultaneous spikes in two features stay separate") {
        auto series = baseline(50);
        series.back() = 30.0;

        auto shocks = ShockDetector::detect_shocks(
            {{"funding_rate", series}, {"open_interest", series}}, kTs, cfg);

        REQUIRE(shocks.size() == 2);
        REQUIRE(shocks[0].index == shocks[1].index);
        REQUIRE(shocks[0].feature != shocks[1].feature);
    }

    SECTION("Extreme outlier is critical") {
        auto series = baseline(300);
        series.back() = 200.0;  // z ~ 17

        auto shocks = ShockDetector::detect_shocks({{"price", series}}, kTs, cfg);

        REQUIRE(shocks.size() == 1);
        REQUIRE(shocks[0].severity == ShockSeverity::Critical);
        REQUIRE(ShockDetector::count_critical(shocks) == 1);
    }

    SECTION("Threshold is configurable") {
        auto series = baseline(100);
        series[20] = 12.0;
        series[70] = 20.0;
        cfg.shock_std_threshold = 5.0;

        auto shocks = ShockDetector::detect_shocks({{"price", series}}, kTs, cfg);

        REQUIRE(shocks.size() == 1);
        REQUIRE(shocks[0].index == 70);
    }
}

TEST_CASE("Shock classification", "[shocks]") {
    REQUIRE(ShockDetector::classify_type("funding_rate") == ShockType::Funding);
    REQUIRE(ShockDetector::classify_type("open_interest_delta") == ShockType::OpenInterest);
    REQUIRE(ShockDetector::classify_type("net_flow") == ShockType::Flow);
    REQUIRE(ShockDetector::classify_type("btc_eth_corr") == ShockType::Correlation);
    REQUIRE(ShockDetector::classify_type("Entropy_1h") == ShockType::Entropy);
    REQUIRE(ShockDetector::classify_type("price") == ShockType::Unknown);

    REQUIRE(ShockDetector::classify_severity(0.5) == ShockSeverity::Low);
    REQUIRE(ShockDetector::classify_severity(1.0) == ShockSeverity::Medium);
    REQUIRE(ShockDetector::classify_severity(2.0) == ShockSeverity::High);
    REQUIRE(ShockDetector::classify_severity(5.0) == ShockSeverity::Critical);
}

TEST_CASE("Critical count ignores resolved shocks", "[shocks]") {
    ShockEvent active;
    active.severity = ShockSeverity::Critical;
    ShockEvent resolved = active;
    resolved.resolved = true;

    std::vector<ShockEvent> shocks{active, resolved};

    REQUIRE(ShockDetector::count_critical(shocks) == 1);
    REQUIRE(ShockDetector::count_critical(shocks, false) == 2);
}

TEST_CASE("Shock ids follow the observation", "[shocks]") {
    PerceptionConfig cfg;
    auto series = baseline(60);
    series[40] = 20.0;

    auto first = ShockDetector::detect_shocks({{"x_flow", series}}, kTs, cfg);

    // One sample later the same spike sits one slot earlier
    series.erase(series.begin());
    series.push_back(1.0);
    auto second = ShockDetector::detect_shocks({{"x_flow", series}}, kTs + 60000, cfg);

    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 1);
    REQUIRE(first[0].index == 40);
    REQUIRE(second[0].index == 39);
    REQUIRE(first[0].shock_id == second[0].shock_id);

    SECTION("Sample interval sets the spacing") {
        cfg.sample_interval_ms = 1000;
        auto shocks = ShockDetector::detect_shocks({{"x_flow", series}}, kTs, cfg);

        REQUIRE(shocks[0].observed_ts_ms == kTs - 20 * 1000);
    }
}
