#pragma once

#include "types.hpp"
#include "config.hpp"
#include "entropy.hpp"

class ShockDetector {
public:
    // Z-score outliers per feature, sorted by descending intensity.
    // No de-duplication across features.
    static std::vector<ShockEvent> detect_shocks(const SeriesMap& market_data,
                                                 int64_t ts_ms,
                                                 const PerceptionConfig& cfg);

    static std::vector<ShockEvent> detect_feature(const std::string& feature,
                                                  const std::vector<double>& series,
                                                  int64_t ts_ms,
                                                  const PerceptionConfig& cfg);

    // Ids follow the observation, not its window position, so a shock
    // keeps its id while the window slides forward
    static int64_t observation_ts(int64_t ts_ms, size_t window_size, size_t index,
                                  int64_t sample_interval_ms);
    static std::string make_shock_id(const std::string& feature, int64_t observed_ts_ms);

    static ShockSeverity classify_severity(double intensity);
    static ShockType classify_type(const std::string& feature);

    static size_t count_critical(const std::vector<ShockEvent>& shocks, bool unresolved_only = true);
};
