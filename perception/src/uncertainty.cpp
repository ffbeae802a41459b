#include "uncertainty.hpp"
#include "util.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

UncertaintyBreakdown UncertaintyAggregator::aggregate(const EntropyMetrics& entropy,
                                                      const NoiseScore& noise,
                                                      const ReflexivityScore& reflexivity,
                                                      const RegimeAlert& regime,
                                                      const PerceptionConfig& cfg) {
    UncertaintyBreakdown result;

    // Normalize each component to [0,1]
    result.entropy_component = stats::clamp(entropy.market_entropy / kMaxEntropyBits, 0.0, 1.0);
    result.noise_component = stats::clamp(noise.noise_level, 0.0, 1.0);
    result.reflexivity_component = stats::clamp(std::fabs(reflexivity.coefficient), 0.0, 1.0);
    result.regime_component = stats::clamp(regime.stress / kStressScale, 0.0, 1.0);

    result.total =
        result.entropy_component * cfg.w_entropy +
        result.noise_component * cfg.w_noise +
        result.reflexivity_component * cfg.w_reflexivity +
        result.regime_component * cfg.w_regime;

    spdlog::debug("Uncertainty: {:.3f} (H={:.2f} N={:.2f} R={:.2f} S={:.2f})",
                  result.total, result.entropy_component, result.noise_component,
                  result.reflexivity_component, result.regime_component);

    return result;
}
