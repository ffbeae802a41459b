#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class EntropyLevel { Low, Medium, High, Extreme };
enum class NoiseLevel { Clean, Normal, Noisy, ExtremeNoise };
enum class Intent { Long, Short, Neutral };
enum class MarketPressure { Long, Short, Neutral, Unknown };
enum class ParticipantType { Whale, Institutional, Unknown };
enum class FeedbackStrength { None, Weak, Moderate, Strong };
enum class ShockSeverity { Low, Medium, High, Critical };
enum class ShockType { Funding, OpenInterest, Flow, Correlation, Entropy, Unknown };
enum class PriceDirection { Up, Down, Flat };
enum class AlertLevel { Info, Watch, Warning, Critical };
enum class RiskMode { Normal, Cautious, Defensive };
enum class AlertPriority { Low, Medium, High, Critical };

const char* to_string(EntropyLevel v);
const char* to_string(NoiseLevel v);
const char* to_string(Intent v);
const char* to_string(MarketPressure v);
const char* to_string(ParticipantType v);
const char* to_string(FeedbackStrength v);
const char* to_string(ShockSeverity v);
const char* to_string(ShockType v);
const char* to_string(PriceDirection v);
const char* to_string(AlertLevel v);
const char* to_string(RiskMode v);
const char* to_string(AlertPriority v);

// LONG/SHORT/NEUTRAL probability triple, always all three present
struct IntentProbabilities {
    double p_long = 0.0;
    double p_short = 0.0;
    double p_neutral = 1.0;

    double sum() const { return p_long + p_short + p_neutral; }
    Intent dominant() const;
    double max_prob() const;
};

struct EntropyMetrics {
    double market_entropy = 0.0;                    // bits, mean of feature entropies
    std::map<std::string, double> feature_entropy;
    std::map<std::string, size_t> sample_counts;    // returns used per feature
    EntropyLevel interpretation = EntropyLevel::Low;
    int bins = 0;
};

struct NoiseScore {
    double noise_level = 0.0;     // [0,1]
    double signal_quality = 1.0;  // 1 - noise_level
    std::map<std::string, double> feature_noise;
    NoiseLevel interpretation = NoiseLevel::Clean;
    bool is_acceptable = true;
    double threshold = 0.0;
    int window = 0;
};

// Microstructure inputs to the intent classifier
struct IntentFeatures {
    double oi_change = 0.0;
    double funding_rate = 0.0;
    double whale_flow = 0.0;
    double basis = 0.0;
    double put_call = 0.0;
};

struct IntentScore {
    IntentProbabilities probabilities;
    Intent dominant_intent = Intent::Neutral;
    double intent_strength = 0.0;
    ParticipantType participant_type = ParticipantType::Unknown;
    IntentFeatures raw;
    IntentFeatures scaled;
    double logit_long = 0.0;
    double logit_short = 0.0;
    double logit_neutral = 0.0;
};

struct ReflexivityScore {
    double coefficient = 0.0;        // [-1,1]
    double market_impact_bps = 0.0;  // [0,5]
    FeedbackStrength feedback_strength = FeedbackStrength::None;
    size_t sample_size = 0;
    std::vector<double> decision_vector;
    std::vector<double> return_vector;
};

struct ShockEvent {
    std::string shock_id;
    std::string feature;
    size_t index = 0;            // position in this cycle's window
    int64_t observed_ts_ms = 0;  // when the outlying observation was taken
    double value = 0.0;
    double mean = 0.0;
    double stddev = 0.0;
    double z_score = 0.0;
    double intensity = 0.0;  // z / 3
    ShockSeverity severity = ShockSeverity::Low;
    ShockType shock_type = ShockType::Unknown;
    PriceDirection expected_direction = PriceDirection::Flat;
    bool resolved = false;
    int64_t detected_ts_ms = 0;
};

struct RegimeIndicators {
    double volatility_acceleration = 0.0;
    double correlation_instability = 0.0;
    double liquidity_stress = 0.0;
    double flow_divergence = 0.0;
    double entropy_spike = 0.0;
};

struct RegimeAlert {
    RegimeIndicators indicators;
    double stress = 0.0;
    double threshold = 0.0;
    double pivot_probability = 0.0;
    bool pivot_detected = false;
    AlertLevel alert_level = AlertLevel::Info;
    std::optional<std::string> current_regime;
    std::optional<std::string> expected_regime;
};

struct UncertaintyBreakdown {
    double entropy_component = 0.0;      // entropy / 5 bits
    double noise_component = 0.0;
    double reflexivity_component = 0.0;  // |coefficient|
    double regime_component = 0.0;       // stress / 2, capped
    double total = 0.0;
};
