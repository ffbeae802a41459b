#include "types.hpp"
#include <algorithm>

const char* to_string(EntropyLevel v) {
    switch (v) {
        case EntropyLevel::Low: return "LOW_ENTROPY";
        case EntropyLevel::Medium: return "MEDIUM_ENTROPY";
        case EntropyLevel::High: return "HIGH_ENTROPY";
        case EntropyLevel::Extreme: return "EXTREME_ENTROPY";
    }
    return "UNKNOWN";
}

const char* to_string(NoiseLevel v) {
    switch (v) {
        case NoiseLevel::Clean: return "CLEAN";
        case NoiseLevel::Normal: return "NORMAL";
        case NoiseLevel::Noisy: return "NOISY";
        case NoiseLevel::ExtremeNoise: return "EXTREME_NOISE";
    }
    return "UNKNOWN";
}

const char* to_string(Intent v) {
    switch (v) {
        case Intent::Long: return "LONG";
        case Intent::Short: return "SHORT";
        case Intent::Neutral: return "NEUTRAL";
    }
    return "UNKNOWN";
}

const char* to_string(MarketPressure v) {
    switch (v) {
        case MarketPressure::Long: return "LONG";
        case MarketPressure::Short: return "SHORT";
        case MarketPressure::Neutral: return "NEUTRAL";
        case MarketPressure::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* to_string(ParticipantType v) {
    switch (v) {
        case ParticipantType::Whale: return "WHALE";
        case ParticipantType::Institutional: return "INSTITUTIONAL";
        case ParticipantType::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* to_string(FeedbackStrength v) {
    switch (v) {
        case FeedbackStrength::None: return "NONE";
        case FeedbackStrength::Weak: return "WEAK";
        case FeedbackStrength::Moderate: return "MODERATE";
        case FeedbackStrength::Strong: return "STRONG";
    }
    return "UNKNOWN";
}

const char* to_string(ShockSeverity v) {
    switch (v) {
        case ShockSeverity::Low: return "LOW";
        case ShockSeverity::Medium: return "MEDIUM";
        case ShockSeverity::High: return "HIGH";
        case ShockSeverity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* to_string(ShockType v) {
    switch (v) {
        case ShockType::Funding: return "FUNDING_SHOCK";
        case ShockType::OpenInterest: return "OI_SHOCK";
        case ShockType::Flow: return "FLOW_SHOCK";
        case ShockType::Correlation: return "CORRELATION_SHOCK";
        case ShockType::Entropy: return "ENTROPY_SHOCK";
        case ShockType::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* to_string(PriceDirection v) {
    switch (v) {
        case PriceDirection::Up: return "UP";
        case PriceDirection::Down: return "DOWN";
        case PriceDirection::Flat: return "FLAT";
    }
    return "UNKNOWN";
}

const char* to_string(AlertLevel v) {
    switch (v) {
        case AlertLevel::Info: return "INFO";
        case AlertLevel::Watch: return "WATCH";
        case AlertLevel::Warning: return "WARNING";
        case AlertLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* to_string(RiskMode v) {
    switch (v) {
        case RiskMode::Normal: return "NORMAL";
        case RiskMode::Cautious: return "CAUTIOUS";
        case RiskMode::Defensive: return "DEFENSIVE";
    }
    return "UNKNOWN";
}

const char* to_string(AlertPriority v) {
    switch (v) {
        case AlertPriority::Low: return "LOW";
        case AlertPriority::Medium: return "MEDIUM";
        case AlertPriority::High: return "HIGH";
        case AlertPriority::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

Intent IntentProbabilities::dominant() const {
    // Ties resolve toward NEUTRAL, then SHORT
    if (p_long > p_short && p_long > p_neutral) return Intent::Long;
    if (p_short > p_neutral) return Intent::Short;
    return Intent::Neutral;
}

double IntentProbabilities::max_prob() const {
    return std::max({p_long, p_short, p_neutral});
}
