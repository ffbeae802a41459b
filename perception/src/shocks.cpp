#include "shocks.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

std::vector<ShockEvent> ShockDetector::detect_shocks(const SeriesMap& market_data,
                                                     int64_t ts_ms,
                                                     const PerceptionConfig& cfg) {
    std::vector<ShockEvent> shocks;

    for (const auto& [name, series] : market_data) {
        auto feature_shocks = detect_feature(name, series, ts_ms, cfg);
        shocks.insert(shocks.end(), feature_shocks.begin(), feature_shocks.end());
    }

    std::stable_sort(shocks.begin(), shocks.end(),
                     [](const ShockEvent& a, const ShockEvent& b) {
                         return a.intensity > b.intensity;
                     });

    if (!shocks.empty()) {
        spdlog::debug("Shocks: {} events, top {} z={:.2f}",
                      shocks.size(), shocks.front().shock_id, shocks.front().z_score);
    }

    return shocks;
}

std::vector<ShockEvent> ShockDetector::detect_feature(const std::string& feature,
                                                      const std::vector<double>& series,
                                                      int64_t ts_ms,
                                                      const PerceptionConfig& cfg) {
    std::vector<ShockEvent> shocks;
    if (series.size() < static_cast<size_t>(cfg.shock_min_points)) return shocks;

    double mean = stats::mean(series);
    double sd = stats::stddev(series);
    if (sd <= 0.0) return shocks;

    // A shock stays active until the feature's latest reading reverts
    double latest_z = std::fabs(series.back() - mean) / sd;
    bool feature_reverted = latest_z < cfg.shock_std_threshold;

    ShockType type = classify_type(feature);

    for (size_t i = 0; i < series.size(); i++) {
        double z = std::fabs(series[i] - mean) / sd;
        if (z <= cfg.shock_std_threshold) continue;

        ShockEvent ev;
        ev.feature = feature;
        ev.index = i;
        ev.observed_ts_ms = observation_ts(ts_ms, series.size(), i, cfg.sample_interval_ms);
        ev.shock_id = make_shock_id(feature, ev.observed_ts_ms);
        ev.value = series[i];
        ev.mean = mean;
        ev.stddev = sd;
        ev.z_score = z;
        ev.intensity = z / 3.0;  // 3 sigma == 1.0
        ev.severity = classify_severity(ev.intensity);
        ev.shock_type = type;
        if (series[i] > mean) {
            ev.expected_direction = PriceDirection::Up;
        } else if (series[i] < mean) {
            ev.expected_direction = PriceDirection::Down;
        } else {
            ev.expected_direction = PriceDirection::Flat;
        }
        ev.resolved = (i + 1 < series.size()) && feature_reverted;
        ev.detected_ts_ms = ts_ms;

        shocks.push_back(ev);
    }

    return shocks;
}

int64_t ShockDetector::observation_ts(int64_t ts_ms, size_t window_size, size_t index,
                                      int64_t sample_interval_ms) {
    // The last observation in the window is taken at the cycle timestamp
    return ts_ms - static_cast<int64_t>(window_size - 1 - index) * sample_interval_ms;
}

std::string ShockDetector::make_shock_id(const std::string& feature, int64_t observed_ts_ms) {
    return feature + "@" + std::to_string(observed_ts_ms);
}

ShockSeverity ShockDetector::classify_severity(double intensity) {
    if (intensity >= 5.0) return ShockSeverity::Critical;
    if (intensity >= 2.0) return ShockSeverity::High;
    if (intensity >= 1.0) return ShockSeverity::Medium;
    return ShockSeverity::Low;
}

ShockType ShockDetector::classify_type(const std::string& feature) {
    std::string name = util::to_lower(feature);

    if (name.find("funding") != std::string::npos) return ShockType::Funding;
    if (name.find("open_interest") != std::string::npos ||
        name.find("oi_") == 0 || name == "oi") {
        return ShockType::OpenInterest;
    }
    if (name.find("flow") != std::string::npos) return ShockType::Flow;
    if (name.find("corr") != std::string::npos) return ShockType::Correlation;
    if (name.find("entropy") != std::string::npos) return ShockType::Entropy;

    return ShockType::Unknown;
}

size_t ShockDetector::count_critical(const std::vector<ShockEvent>& shocks, bool unresolved_only) {
    return static_cast<size_t>(std::count_if(shocks.begin(), shocks.end(),
        [unresolved_only](const ShockEvent& s) {
            return s.severity == ShockSeverity::Critical && (!unresolved_only || !s.resolved);
        }));
}
