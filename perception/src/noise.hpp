#pragma once

#include "types.hpp"
#include "config.hpp"
#include "entropy.hpp"

class NoiseEvaluator {
public:
    // Residual-to-trend variance ratio per feature, mapped to [0,1] and averaged
    static NoiseScore evaluate(const SeriesMap& market_data, const PerceptionConfig& cfg);

    // Noise level of one series; nullopt when shorter than window + 1
    static std::optional<double> series_noise(const std::vector<double>& series, int window);

    static NoiseLevel classify(double noise_level);

private:
    static std::vector<double> moving_average(const std::vector<double>& series, int window);
};
