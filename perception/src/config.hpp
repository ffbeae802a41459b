#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <nlohmann/json.hpp>

// Cycle-invariant engine configuration. Loaded once per process and
// passed by const reference into every component.
struct PerceptionConfig {
    // Guards
    double noise_threshold = 0.7;
    double uncertainty_threshold = 0.8;
    double regime_stress_threshold = 1.0;
    double shock_std_threshold = 3.0;
    double shock_intensity_threshold = 3.0;  // aggregate active intensity worth flagging

    // Windows
    int entropy_bins = 32;  // log2(32) == 5 bits, the entropy normalization ceiling
    int noise_window = 5;
    int reflexivity_window = 20;
    int shock_min_points = 10;
    std::string reflexivity_price_feature = "price";
    int64_t sample_interval_ms = 60000;  // spacing of market_data observations

    // Uncertainty weights (canonical default sums to 1)
    double w_entropy = 0.30;
    double w_noise = 0.30;
    double w_reflexivity = 0.15;
    double w_regime = 0.25;

    // Performance gate (advisory)
    double max_computation_time_ms = 100.0;

    // Service
    std::string engine_version = "1.0.0";
    std::string log_level = "info";

    static PerceptionConfig from_env();
    void validate() const;
    nlohmann::json to_json() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static int64_t get_env_int64(const char* name, int64_t default_val);
    static double get_env_double(const char* name, double default_val);
};
