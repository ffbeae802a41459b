#include "input.hpp"
#include "util.hpp"
#include <cmath>
#include <stdexcept>

double PriorDecision::direction() const {
    std::string a = util::to_upper(action);
    if (a == "BUY" || a == "LONG") return 1.0;
    if (a == "SELL" || a == "SHORT") return -1.0;
    return 0.0;
}

void from_json(const nlohmann::json& j, PriorDecision& d) {
    d.ts_ms = j.value("ts_ms", int64_t{0});
    d.action = j.value("action", std::string{});
    d.tags = j.value("tags", std::vector<std::string>{});
}

void from_json(const nlohmann::json& j, MetaPerceptionInput& in) {
    in.ts_ms = j.at("ts_ms").get<int64_t>();
    in.market_data = j.value("market_data", std::map<std::string, std::vector<double>>{});
    in.features = j.value("features", std::map<std::string, double>{});
    if (j.contains("prior_decisions")) {
        in.prior_decisions = j.at("prior_decisions").get<std::vector<PriorDecision>>();
    }
    in.portfolio_context = j.value("portfolio_context", nlohmann::json::object());
    in.governance_context = j.value("governance_context", nlohmann::json::object());
}

void InputValidator::validate(const MetaPerceptionInput& in) {
    if (in.ts_ms <= 0) {
        throw std::runtime_error("Input timestamp must be positive");
    }

    for (const auto& [name, series] : in.market_data) {
        for (size_t i = 0; i < series.size(); i++) {
            if (!std::isfinite(series[i])) {
                throw std::runtime_error("Non-finite value in series " + name +
                                         " at index " + std::to_string(i));
            }
        }
    }

    for (const auto& [name, value] : in.features) {
        if (!std::isfinite(value)) {
            throw std::runtime_error("Non-finite feature " + name);
        }
    }
}
