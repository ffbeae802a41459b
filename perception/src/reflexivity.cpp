#include "reflexivity.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
constexpr double kBpsPerUnitCorrelation = 10.0;
}

ReflexivityScore ReflexivityAnalyzer::analyze(const std::vector<PriorDecision>& decisions,
                                              const std::vector<double>& prices,
                                              const PerceptionConfig& cfg) {
    auto returns = simple_returns(prices);

    size_t n = std::min({decisions.size(), returns.size(),
                         static_cast<size_t>(cfg.reflexivity_window)});

    std::vector<double> dv;
    std::vector<double> rv;
    dv.reserve(n);
    rv.reserve(n);

    // Align the tails: decision i is followed by return i
    for (size_t i = decisions.size() - n; i < decisions.size(); i++) {
        dv.push_back(decisions[i].direction());
    }
    for (size_t i = returns.size() - n; i < returns.size(); i++) {
        rv.push_back(returns[i]);
    }

    return analyze_aligned(dv, rv);
}

ReflexivityScore ReflexivityAnalyzer::analyze_aligned(const std::vector<double>& decision_vector,
                                                      const std::vector<double>& return_vector) {
    ReflexivityScore result;
    result.decision_vector = decision_vector;
    result.return_vector = return_vector;
    result.sample_size = std::min(decision_vector.size(), return_vector.size());

    if (result.sample_size < 2 || decision_vector.size() != return_vector.size()) {
        spdlog::debug("Reflexivity: {} aligned samples, neutral result", result.sample_size);
        return result;
    }

    result.coefficient = stats::clamp(stats::pearson(decision_vector, return_vector), -1.0, 1.0);
    result.market_impact_bps = impact_bps(result.coefficient);
    result.feedback_strength = classify(result.coefficient);

    return result;
}

FeedbackStrength ReflexivityAnalyzer::classify(double coefficient) {
    double magnitude = std::fabs(coefficient);
    if (magnitude < 0.1) return FeedbackStrength::None;
    if (magnitude < 0.3) return FeedbackStrength::Weak;
    if (magnitude < 0.6) return FeedbackStrength::Moderate;
    return FeedbackStrength::Strong;
}

double ReflexivityAnalyzer::impact_bps(double coefficient) {
    return std::min(kMaxImpactBps, std::fabs(coefficient) * kBpsPerUnitCorrelation);
}

std::vector<double> ReflexivityAnalyzer::simple_returns(const std::vector<double>& prices) {
    std::vector<double> returns;
    for (size_t i = 1; i < prices.size(); i++) {
        if (prices[i - 1] == 0.0) continue;
        returns.push_back((prices[i] - prices[i - 1]) / prices[i - 1]);
    }
    return returns;
}
