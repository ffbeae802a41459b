#pragma once

#include "state.hpp"
#include <map>

// Leading-indicator weights for regime stress
struct RegimeWeights {
    double volatility_acceleration = 0.30;
    double correlation_instability = 0.25;
    double liquidity_stress = 0.20;
    double flow_divergence = 0.15;
    double entropy_spike = 0.10;
};

class RegimePivotDetector {
public:
    static RegimeAlert assess(const std::map<std::string, double>& features,
                              double market_entropy,
                              const std::optional<PerceptionState>& previous,
                              const PerceptionConfig& cfg);

    static RegimeAlert assess(const RegimeIndicators& indicators,
                              const std::optional<std::string>& current_regime,
                              const PerceptionConfig& cfg);

    static double compute_stress(const RegimeIndicators& indicators);
    static double pivot_probability(double stress, double threshold);
    static AlertLevel classify_alert(double stress, double threshold);
    static std::string expected_regime(const RegimeIndicators& indicators);

private:
    static RegimeIndicators extract(const std::map<std::string, double>& features,
                                    double market_entropy,
                                    const std::optional<PerceptionState>& previous);
};
