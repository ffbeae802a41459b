#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace util {
    std::string current_iso8601();
    std::string format_iso8601(int64_t ts_ms);
    int64_t current_timestamp_ms();

    // FNV-1a, stable across platforms and runs
    uint64_t fnv1a(const std::string& data);
    std::string hash_hex(const std::string& data);
    std::string hash_parts(const std::vector<std::string>& parts);

    std::string to_upper(std::string s);
    std::string to_lower(std::string s);
}

namespace stats {
    double mean(const std::vector<double>& xs);
    // Population variance
    double variance(const std::vector<double>& xs);
    double stddev(const std::vector<double>& xs);
    // 0 when either side has zero variance or lengths differ
    double pearson(const std::vector<double>& xs, const std::vector<double>& ys);
    double clamp(double v, double lo, double hi);
}
