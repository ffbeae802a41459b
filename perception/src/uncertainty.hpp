#pragma once

#include "types.hpp"
#include "config.hpp"

class UncertaintyAggregator {
public:
    static UncertaintyBreakdown aggregate(const EntropyMetrics& entropy,
                                          const NoiseScore& noise,
                                          const ReflexivityScore& reflexivity,
                                          const RegimeAlert& regime,
                                          const PerceptionConfig& cfg);

    static constexpr double kMaxEntropyBits = 5.0;
    static constexpr double kStressScale = 2.0;
};
