#pragma once

#include "types.hpp"
#include "config.hpp"
#include <map>
#include <string>
#include <vector>

using SeriesMap = std::map<std::string, std::vector<double>>;

class EntropyEngine {
public:
    // Shannon entropy (bits) of discretized log-returns, averaged across features
    static EntropyMetrics compute_market_entropy(const SeriesMap& market_data,
                                                 const PerceptionConfig& cfg);

    // Entropy of a single series; nullopt when it has no usable returns
    static std::optional<double> compute_series_entropy(const std::vector<double>& series,
                                                        int bins,
                                                        size_t* samples = nullptr);

    static EntropyLevel classify(double entropy_bits);

private:
    static std::vector<double> log_returns(const std::vector<double>& series);
    static double shannon_bits(const std::vector<double>& values, int bins);
};
