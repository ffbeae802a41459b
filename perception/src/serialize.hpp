#pragma once

#include "decision.hpp"
#include "delta.hpp"
#include "override.hpp"
#include "snapshot.hpp"
#include <nlohmann/json.hpp>

// nlohmann ADL hooks; enums serialize as their upper-case names
void to_json(nlohmann::json& j, const IntentProbabilities& p);
void to_json(nlohmann::json& j, const EntropyMetrics& m);
void to_json(nlohmann::json& j, const NoiseScore& n);
void to_json(nlohmann::json& j, const IntentFeatures& f);
void to_json(nlohmann::json& j, const IntentScore& s);
void to_json(nlohmann::json& j, const ReflexivityScore& r);
void to_json(nlohmann::json& j, const ShockEvent& e);
void to_json(nlohmann::json& j, const RegimeIndicators& x);
void to_json(nlohmann::json& j, const RegimeAlert& a);
void to_json(nlohmann::json& j, const UncertaintyBreakdown& u);
void to_json(nlohmann::json& j, const PerceptionState& s);
void to_json(nlohmann::json& j, const PerceptionSnapshot& s);
void to_json(nlohmann::json& j, const PerceptionDelta& d);
void to_json(nlohmann::json& j, const MetaPerceptionDecision& d);
void to_json(nlohmann::json& j, const OverrideRecord& r);
