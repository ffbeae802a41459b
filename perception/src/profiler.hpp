#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

// Wall-clock timing of pipeline stages against an advisory budget
class StageProfiler {
public:
    explicit StageProfiler(double budget_ms);

    template <typename Fn>
    auto time(const std::string& stage, Fn&& fn) -> decltype(fn()) {
        auto start = std::chrono::steady_clock::now();
        auto result = fn();
        record(stage, start);
        return result;
    }

    double elapsed_ms() const;
    double budget_ms() const { return budget_ms_; }
    bool within_budget(double elapsed_ms) const { return elapsed_ms <= budget_ms_; }
    const std::vector<std::pair<std::string, double>>& stages() const { return stages_; }

private:
    void record(const std::string& stage, std::chrono::steady_clock::time_point start);

    double budget_ms_;
    std::chrono::steady_clock::time_point created_;
    std::vector<std::pair<std::string, double>> stages_;
};
