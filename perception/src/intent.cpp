#include "intent.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

const IntentWeights IntentInferencer::kLongWeights    = { 0.8,  0.6,  1.0,  0.5, -0.7, 0.0};
const IntentWeights IntentInferencer::kShortWeights   = {-0.4, -0.6, -1.0, -0.5,  0.7, 0.0};
const IntentWeights IntentInferencer::kNeutralWeights = { 0.0,  0.0,  0.0,  0.0,  0.0, 0.5};

namespace {
constexpr double kFeatureCap = 3.0;
constexpr double kWhaleNotional = 100e6;
constexpr double kInstitutionalNotional = 10e6;

double lookup(const std::map<std::string, double>& features, const char* key, double fallback) {
    auto it = features.find(key);
    if (it == features.end() || !std::isfinite(it->second)) return fallback;
    return it->second;
}
}

IntentScore IntentInferencer::infer(const std::map<std::string, double>& features) {
    return infer(extract(features));
}

IntentScore IntentInferencer::infer(const IntentFeatures& raw) {
    IntentScore result;
    result.raw = raw;
    result.scaled = rescale(raw);

    result.logit_long = logit(kLongWeights, result.scaled);
    result.logit_short = logit(kShortWeights, result.scaled);
    result.logit_neutral = logit(kNeutralWeights, result.scaled);

    result.probabilities = softmax(result.logit_long, result.logit_short, result.logit_neutral);
    result.dominant_intent = result.probabilities.dominant();
    result.intent_strength = result.probabilities.max_prob();
    result.participant_type = classify_participant(raw.whale_flow);

    spdlog::debug("Intent: L={:.3f} S={:.3f} N={:.3f} -> {} ({})",
                  result.probabilities.p_long, result.probabilities.p_short,
                  result.probabilities.p_neutral, to_string(result.dominant_intent),
                  to_string(result.participant_type));

    return result;
}

IntentFeatures IntentInferencer::extract(const std::map<std::string, double>& features) {
    IntentFeatures raw;
    raw.oi_change = lookup(features, "open_interest_change", 0.0);
    raw.funding_rate = lookup(features, "funding_rate", 0.0);
    raw.whale_flow = lookup(features, "whale_net_flow", 0.0);
    raw.basis = lookup(features, "futures_basis", 0.0);
    raw.put_call = lookup(features, "put_call_ratio", 1.0);
    return raw;
}

IntentFeatures IntentInferencer::rescale(const IntentFeatures& raw) {
    IntentFeatures s;
    s.oi_change = stats::clamp(raw.oi_change / 10.0, -kFeatureCap, kFeatureCap);      // percent
    s.funding_rate = stats::clamp(raw.funding_rate * 1000.0, -kFeatureCap, kFeatureCap);
    s.whale_flow = stats::clamp(raw.whale_flow / 1e8, -kFeatureCap, kFeatureCap);     // notional
    s.basis = stats::clamp(raw.basis / 2.0, -kFeatureCap, kFeatureCap);               // percent
    s.put_call = stats::clamp(raw.put_call - 1.0, -kFeatureCap, kFeatureCap);         // 1.0 is neutral
    return s;
}

ParticipantType IntentInferencer::classify_participant(double whale_flow) {
    double magnitude = std::fabs(whale_flow);
    if (magnitude >= kWhaleNotional) return ParticipantType::Whale;
    if (magnitude >= kInstitutionalNotional) return ParticipantType::Institutional;
    return ParticipantType::Unknown;
}

IntentProbabilities IntentInferencer::softmax(double logit_long, double logit_short,
                                              double logit_neutral) {
    double m = std::max({logit_long, logit_short, logit_neutral});
    double el = std::exp(logit_long - m);
    double es = std::exp(logit_short - m);
    double en = std::exp(logit_neutral - m);
    double z = el + es + en;

    IntentProbabilities p;
    p.p_long = el / z;
    p.p_short = es / z;
    p.p_neutral = en / z;
    return p;
}

double IntentInferencer::logit(const IntentWeights& w, const IntentFeatures& x) {
    return w.oi_change * x.oi_change +
           w.funding_rate * x.funding_rate +
           w.whale_flow * x.whale_flow +
           w.basis * x.basis +
           w.put_call * x.put_call +
           w.intercept;
}
