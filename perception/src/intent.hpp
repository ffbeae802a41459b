#pragma once

#include "types.hpp"
#include <map>
#include <string>

// Pre-calibrated logit weights for one hypothesis
struct IntentWeights {
    double oi_change;
    double funding_rate;
    double whale_flow;
    double basis;
    double put_call;
    double intercept;
};

class IntentInferencer {
public:
    static IntentScore infer(const std::map<std::string, double>& features);
    static IntentScore infer(const IntentFeatures& raw);

    static IntentFeatures extract(const std::map<std::string, double>& features);
    static IntentFeatures rescale(const IntentFeatures& raw);
    static ParticipantType classify_participant(double whale_flow);

    // Numerically stable softmax over the three hypotheses
    static IntentProbabilities softmax(double logit_long, double logit_short, double logit_neutral);

    static const IntentWeights kLongWeights;
    static const IntentWeights kShortWeights;
    static const IntentWeights kNeutralWeights;

private:
    static double logit(const IntentWeights& w, const IntentFeatures& x);
};
