#pragma once

#include "types.hpp"
#include "config.hpp"
#include "input.hpp"

class ReflexivityAnalyzer {
public:
    // Correlates the last decisions with the returns that followed them
    static ReflexivityScore analyze(const std::vector<PriorDecision>& decisions,
                                    const std::vector<double>& prices,
                                    const PerceptionConfig& cfg);

    // Core computation on already-aligned vectors
    static ReflexivityScore analyze_aligned(const std::vector<double>& decision_vector,
                                            const std::vector<double>& return_vector);

    static FeedbackStrength classify(double coefficient);
    static double impact_bps(double coefficient);

    static constexpr double kMaxImpactBps = 5.0;

private:
    static std::vector<double> simple_returns(const std::vector<double>& prices);
};
