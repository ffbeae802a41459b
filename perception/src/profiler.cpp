#include "profiler.hpp"

StageProfiler::StageProfiler(double budget_ms)
    : budget_ms_(budget_ms)
    , created_(std::chrono::steady_clock::now())
{}

double StageProfiler::elapsed_ms() const {
    std::chrono::duration<double, std::milli> d = std::chrono::steady_clock::now() - created_;
    return d.count();
}

void StageProfiler::record(const std::string& stage, std::chrono::steady_clock::time_point start) {
    std::chrono::duration<double, std::milli> d = std::chrono::steady_clock::now() - start;
    stages_.emplace_back(stage, d.count());
}
