#include "regime.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
constexpr double kSigmoidSteepness = 5.0;
constexpr double kCriticalStress = 2.0;
constexpr double kWatchStress = 0.7;

double lookup(const std::map<std::string, double>& features, const char* key, double fallback) {
    auto it = features.find(key);
    if (it == features.end() || !std::isfinite(it->second)) return fallback;
    return it->second;
}
}

RegimeAlert RegimePivotDetector::assess(const std::map<std::string, double>& features,
                                        double market_entropy,
                                        const std::optional<PerceptionState>& previous,
                                        const PerceptionConfig& cfg) {
    std::optional<std::string> current;
    if (previous) current = previous->current_regime;

    return assess(extract(features, market_entropy, previous), current, cfg);
}

RegimeAlert RegimePivotDetector::assess(const RegimeIndicators& indicators,
                                        const std::optional<std::string>& current_regime,
                                        const PerceptionConfig& cfg) {
    RegimeAlert result;
    result.indicators = indicators;
    result.threshold = cfg.regime_stress_threshold;
    result.current_regime = current_regime;

    result.stress = compute_stress(indicators);
    result.pivot_detected = result.stress >= cfg.regime_stress_threshold;
    result.pivot_probability = pivot_probability(result.stress, cfg.regime_stress_threshold);
    result.alert_level = classify_alert(result.stress, cfg.regime_stress_threshold);

    if (result.pivot_detected) {
        result.expected_regime = expected_regime(indicators);
        spdlog::info("Regime pivot: stress={:.3f} p={:.3f} {} -> {}",
                     result.stress, result.pivot_probability,
                     current_regime.value_or("UNSET"), *result.expected_regime);
    } else {
        spdlog::debug("Regime: stress={:.3f} ({})", result.stress, to_string(result.alert_level));
    }

    return result;
}

double RegimePivotDetector::compute_stress(const RegimeIndicators& x) {
    static const RegimeWeights w;

    double stress =
        x.volatility_acceleration * w.volatility_acceleration +
        x.correlation_instability * w.correlation_instability +
        x.liquidity_stress * w.liquidity_stress +
        x.flow_divergence * w.flow_divergence +
        x.entropy_spike * w.entropy_spike;

    return std::max(0.0, stress);
}

double RegimePivotDetector::pivot_probability(double stress, double threshold) {
    return 1.0 / (1.0 + std::exp(-kSigmoidSteepness * (stress - threshold)));
}

AlertLevel RegimePivotDetector::classify_alert(double stress, double threshold) {
    if (stress >= kCriticalStress) return AlertLevel::Critical;
    if (stress >= threshold) return AlertLevel::Warning;
    if (stress >= kWatchStress) return AlertLevel::Watch;
    return AlertLevel::Info;
}

std::string RegimePivotDetector::expected_regime(const RegimeIndicators& x) {
    if (x.volatility_acceleration > 2.0 && x.flow_divergence < -1.0) return "CRISIS";
    if (x.volatility_acceleration < 0.5 && x.flow_divergence > 0.5) return "BULL";
    if (x.volatility_acceleration > 1.0) return "BEAR";
    return "NEUTRAL";
}

RegimeIndicators RegimePivotDetector::extract(const std::map<std::string, double>& features,
                                              double market_entropy,
                                              const std::optional<PerceptionState>& previous) {
    RegimeIndicators x;
    x.volatility_acceleration = lookup(features, "volatility_acceleration", 0.0);
    x.correlation_instability = lookup(features, "correlation_instability", 0.0);
    x.liquidity_stress = lookup(features, "liquidity_stress", 0.0);
    x.flow_divergence = lookup(features, "flow_divergence", 0.0);

    // Without an explicit reading, a spike is entropy gained since last cycle
    double derived_spike = previous ? std::max(0.0, market_entropy - previous->market_entropy) : 0.0;
    x.entropy_spike = lookup(features, "entropy_spike", derived_spike);

    return x;
}
