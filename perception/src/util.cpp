#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

std::string current_iso8601() {
    return format_iso8601(current_timestamp_ms());
}

std::string format_iso8601(int64_t ts_ms) {
    std::time_t secs = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%T")
       << '.' << std::setw(3) << std::setfill('0') << (ts_ms % 1000) << 'Z';
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

uint64_t fnv1a(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string hash_hex(const std::string& data) {
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << fnv1a(data);
    return ss.str();
}

std::string hash_parts(const std::vector<std::string>& parts) {
    std::string combined;
    for (const auto& p : parts) {
        combined += p + "|";
    }
    return hash_hex(combined);
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace util

namespace stats {

double mean(const std::vector<double>& xs) {
    if (xs.empty()) return 0.0;
    double sum = 0.0;
    for (double x : xs) sum += x;
    return sum / xs.size();
}

double variance(const std::vector<double>& xs) {
    if (xs.size() < 2) return 0.0;
    double m = mean(xs);
    double acc = 0.0;
    for (double x : xs) {
        acc += (x - m) * (x - m);
    }
    return acc / xs.size();
}

double stddev(const std::vector<double>& xs) {
    return std::sqrt(variance(xs));
}

double pearson(const std::vector<double>& xs, const std::vector<double>& ys) {
    if (xs.size() != ys.size() || xs.size() < 2) return 0.0;

    double mx = mean(xs);
    double my = mean(ys);
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < xs.size(); i++) {
        double dx = xs[i] - mx;
        double dy = ys[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    if (sxx <= 1e-18 || syy <= 1e-18) return 0.0;
    return clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

double clamp(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

} // namespace stats
