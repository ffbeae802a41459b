#include "config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string PerceptionConfig::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

namespace {
// Whole value must parse; anything else keeps the default
template <typename T, typename Parse>
T env_number(const char* name, T default_val, Parse parse) {
    const char* raw = std::getenv(name);
    if (!raw) return default_val;

    try {
        size_t used = 0;
        T value = parse(std::string(raw), &used);
        if (raw[used] == '\0') return value;
        spdlog::warn("Trailing characters in {}='{}', using default {}", name, raw, default_val);
    } catch (const std::exception& e) {
        spdlog::warn("Invalid value {}='{}' ({}), using default {}", name, raw, e.what(), default_val);
    }
    return default_val;
}
}

int PerceptionConfig::get_env_int(const char* name, int default_val) {
    return env_number(name, default_val,
                      [](const std::string& s, size_t* pos) { return std::stoi(s, pos); });
}

int64_t PerceptionConfig::get_env_int64(const char* name, int64_t default_val) {
    return env_number(name, default_val,
                      [](const std::string& s, size_t* pos) { return static_cast<int64_t>(std::stoll(s, pos)); });
}

double PerceptionConfig::get_env_double(const char* name, double default_val) {
    return env_number(name, default_val,
                      [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
}

PerceptionConfig PerceptionConfig::from_env() {
    PerceptionConfig cfg;

    cfg.noise_threshold = get_env_double("PERCEPTION_NOISE_THRESHOLD", cfg.noise_threshold);
    cfg.uncertainty_threshold = get_env_double("PERCEPTION_UNCERTAINTY_THRESHOLD", cfg.uncertainty_threshold);
    cfg.regime_stress_threshold = get_env_double("PERCEPTION_REGIME_STRESS_THRESHOLD", cfg.regime_stress_threshold);
    cfg.shock_std_threshold = get_env_double("PERCEPTION_SHOCK_STD_THRESHOLD", cfg.shock_std_threshold);
    cfg.shock_intensity_threshold = get_env_double("PERCEPTION_SHOCK_INTENSITY_THRESHOLD", cfg.shock_intensity_threshold);

    cfg.entropy_bins = get_env_int("PERCEPTION_ENTROPY_BINS", cfg.entropy_bins);
    cfg.noise_window = get_env_int("PERCEPTION_NOISE_WINDOW", cfg.noise_window);
    cfg.reflexivity_window = get_env_int("PERCEPTION_REFLEXIVITY_WINDOW", cfg.reflexivity_window);
    cfg.shock_min_points = get_env_int("PERCEPTION_SHOCK_MIN_POINTS", cfg.shock_min_points);
    cfg.reflexivity_price_feature = get_env("PERCEPTION_PRICE_FEATURE", cfg.reflexivity_price_feature);
    cfg.sample_interval_ms = get_env_int64("PERCEPTION_SAMPLE_INTERVAL_MS", cfg.sample_interval_ms);

    cfg.w_entropy = get_env_double("PERCEPTION_W_ENTROPY", cfg.w_entropy);
    cfg.w_noise = get_env_double("PERCEPTION_W_NOISE", cfg.w_noise);
    cfg.w_reflexivity = get_env_double("PERCEPTION_W_REFLEXIVITY", cfg.w_reflexivity);
    cfg.w_regime = get_env_double("PERCEPTION_W_REGIME", cfg.w_regime);

    cfg.max_computation_time_ms = get_env_double("PERCEPTION_MAX_COMPUTATION_MS", cfg.max_computation_time_ms);

    cfg.engine_version = get_env("PERCEPTION_ENGINE_VERSION", cfg.engine_version);
    cfg.log_level = get_env("LOG_LEVEL", cfg.log_level);

    return cfg;
}

void PerceptionConfig::validate() const {
    if (w_entropy < 0 || w_noise < 0 || w_reflexivity < 0 || w_regime < 0) {
        throw std::runtime_error("Uncertainty weights must be non-negative");
    }
    if (w_entropy + w_noise + w_reflexivity + w_regime <= 0) {
        throw std::runtime_error("At least one uncertainty weight must be positive");
    }
    if (noise_threshold <= 0 || uncertainty_threshold <= 0 ||
        regime_stress_threshold <= 0 || shock_std_threshold <= 0 ||
        shock_intensity_threshold <= 0) {
        throw std::runtime_error("Thresholds must be positive");
    }
    if (entropy_bins < 2) {
        throw std::runtime_error("PERCEPTION_ENTROPY_BINS must be at least 2");
    }
    if (noise_window < 2 || reflexivity_window < 2 || shock_min_points < 2) {
        throw std::runtime_error("Windows must span at least 2 points");
    }
    if (sample_interval_ms <= 0) {
        throw std::runtime_error("PERCEPTION_SAMPLE_INTERVAL_MS must be positive");
    }
    if (max_computation_time_ms <= 0) {
        throw std::runtime_error("PERCEPTION_MAX_COMPUTATION_MS must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Guards: noise<{}, uncertainty<{}, stress<{}, shock z>{}",
                 noise_threshold, uncertainty_threshold,
                 regime_stress_threshold, shock_std_threshold);
    spdlog::info("  Weights: entropy={}, noise={}, reflexivity={}, regime={}",
                 w_entropy, w_noise, w_reflexivity, w_regime);
}

nlohmann::json PerceptionConfig::to_json() const {
    return {
        {"noise_threshold", noise_threshold},
        {"uncertainty_threshold", uncertainty_threshold},
        {"regime_stress_threshold", regime_stress_threshold},
        {"shock_std_threshold", shock_std_threshold},
        {"shock_intensity_threshold", shock_intensity_threshold},
        {"entropy_bins", entropy_bins},
        {"noise_window", noise_window},
        {"reflexivity_window", reflexivity_window},
        {"shock_min_points", shock_min_points},
        {"reflexivity_price_feature", reflexivity_price_feature},
        {"sample_interval_ms", sample_interval_ms},
        {"weights", {
            {"entropy", w_entropy},
            {"noise", w_noise},
            {"reflexivity", w_reflexivity},
            {"regime", w_regime}
        }},
        {"max_computation_time_ms", max_computation_time_ms},
        {"engine_version", engine_version}
    };
}
