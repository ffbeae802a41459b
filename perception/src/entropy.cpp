#include "entropy.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
// Additive smoothing so empty bins never yield log(0)
constexpr double kSmoothing = 1e-10;
}

EntropyMetrics EntropyEngine::compute_market_entropy(const SeriesMap& market_data,
                                                     const PerceptionConfig& cfg) {
    EntropyMetrics result;
    result.bins = cfg.entropy_bins;

    double total = 0.0;
    for (const auto& [name, series] : market_data) {
        if (series.size() < 2) {
            spdlog::debug("Entropy: skipping {} ({} points)", name, series.size());
            continue;
        }

        size_t samples = 0;
        auto h = compute_series_entropy(series, cfg.entropy_bins, &samples);
        if (!h) {
            spdlog::debug("Entropy: no usable returns for {}", name);
            continue;
        }

        result.feature_entropy[name] = *h;
        result.sample_counts[name] = samples;
        total += *h;
    }

    if (!result.feature_entropy.empty()) {
        result.market_entropy = total / result.feature_entropy.size();
    }
    result.interpretation = classify(result.market_entropy);

    return result;
}

std::optional<double> EntropyEngine::compute_series_entropy(const std::vector<double>& series,
                                                            int bins,
                                                            size_t* samples) {
    auto returns = log_returns(series);
    if (samples) *samples = returns.size();
    if (returns.empty()) return std::nullopt;

    return shannon_bits(returns, bins);
}

EntropyLevel EntropyEngine::classify(double entropy_bits) {
    if (entropy_bits < 1.5) return EntropyLevel::Low;
    if (entropy_bits < 3.0) return EntropyLevel::Medium;
    if (entropy_bits < 4.5) return EntropyLevel::High;
    return EntropyLevel::Extreme;
}

std::vector<double> EntropyEngine::log_returns(const std::vector<double>& series) {
    std::vector<double> returns;
    returns.reserve(series.size());

    for (size_t i = 1; i < series.size(); i++) {
        // Log-returns are undefined for non-positive observations
        if (series[i - 1] <= 0 || series[i] <= 0) continue;
        returns.push_back(std::log(series[i] / series[i - 1]));
    }

    return returns;
}

double EntropyEngine::shannon_bits(const std::vector<double>& values, int bins) {
    auto [lo_it, hi_it] = std::minmax_element(values.begin(), values.end());
    double lo = *lo_it;
    double hi = *hi_it;

    // Zero-variance distribution carries no information
    if (hi - lo < 1e-12) return 0.0;

    std::vector<double> counts(bins, 0.0);
    double width = (hi - lo) / bins;
    for (double v : values) {
        int b = static_cast<int>((v - lo) / width);
        b = std::min(bins - 1, std::max(0, b));
        counts[b] += 1.0;
    }

    double denom = values.size() + kSmoothing * bins;
    double h = 0.0;
    for (double c : counts) {
        double p = (c + kSmoothing) / denom;
        h -= p * std::log2(p);
    }

    return std::max(0.0, h);
}
