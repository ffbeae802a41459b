#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PriorDecision {
    int64_t ts_ms = 0;
    std::string action;  // BUY / SELL / HOLD ...
    std::vector<std::string> tags;

    // +1 buy/long, -1 sell/short, 0 otherwise
    double direction() const;
};

struct MetaPerceptionInput {
    int64_t ts_ms = 0;
    std::map<std::string, std::vector<double>> market_data;
    std::map<std::string, double> features;
    std::vector<PriorDecision> prior_decisions;

    // Passed through untouched
    nlohmann::json portfolio_context = nlohmann::json::object();
    nlohmann::json governance_context = nlohmann::json::object();
};

void from_json(const nlohmann::json& j, PriorDecision& d);
void from_json(const nlohmann::json& j, MetaPerceptionInput& in);

class InputValidator {
public:
    // Throws std::runtime_error on malformed top-level input
    static void validate(const MetaPerceptionInput& in);
};
