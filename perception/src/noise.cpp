#include "noise.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {
constexpr double kVarianceEps = 1e-18;
}

NoiseScore NoiseEvaluator::evaluate(const SeriesMap& market_data, const PerceptionConfig& cfg) {
    NoiseScore result;
    result.threshold = cfg.noise_threshold;
    result.window = cfg.noise_window;

    double total = 0.0;
    for (const auto& [name, series] : market_data) {
        auto noise = series_noise(series, cfg.noise_window);
        if (!noise) {
            spdlog::debug("Noise: skipping {} ({} points, window {})",
                          name, series.size(), cfg.noise_window);
            continue;
        }
        result.feature_noise[name] = *noise;
        total += *noise;
    }

    // No qualifying feature leaves the default clean reading
    if (!result.feature_noise.empty()) {
        result.noise_level = total / result.feature_noise.size();
    }

    result.signal_quality = 1.0 - result.noise_level;
    result.interpretation = classify(result.noise_level);
    result.is_acceptable = result.noise_level < cfg.noise_threshold;

    return result;
}

std::optional<double> NoiseEvaluator::series_noise(const std::vector<double>& series, int window) {
    if (window < 1 || series.size() < static_cast<size_t>(window) + 1) return std::nullopt;

    auto trend = moving_average(series, window);

    std::vector<double> residual;
    residual.reserve(trend.size());
    for (size_t i = 0; i < trend.size(); i++) {
        residual.push_back(series[i + window - 1] - trend[i]);
    }

    double var_trend = stats::variance(trend);
    double var_resid = stats::variance(residual);

    if (var_trend < kVarianceEps) {
        // Flat trend: all-noise unless the residual is flat too
        return var_resid < kVarianceEps ? 0.0 : 1.0;
    }

    double ratio = var_resid / var_trend;
    return ratio / (1.0 + ratio);
}

NoiseLevel NoiseEvaluator::classify(double noise_level) {
    if (noise_level < 0.3) return NoiseLevel::Clean;
    if (noise_level < 0.5) return NoiseLevel::Normal;
    if (noise_level < 0.7) return NoiseLevel::Noisy;
    return NoiseLevel::ExtremeNoise;
}

std::vector<double> NoiseEvaluator::moving_average(const std::vector<double>& series, int window) {
    std::vector<double> ma;
    ma.reserve(series.size() - window + 1);

    double sum = 0.0;
    for (size_t i = 0; i < series.size(); i++) {
        sum += series[i];
        if (i >= static_cast<size_t>(window)) {
            sum -= series[i - window];
        }
        if (i + 1 >= static_cast<size_t>(window)) {
            ma.push_back(sum / window);
        }
    }

    return ma;
}
