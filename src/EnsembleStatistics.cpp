#include "EnsembleStatistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace CEED {
namespace EnsembleStatistics {

double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    p = std::min(1.0, std::max(0.0, p));
    const double pos = p * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] * (1.0 - frac) + sorted[hi] * frac;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double standardDeviation(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    double var = 0.0;
    for (double v : values) var += (v - m) * (v - m);
    return std::sqrt(var / static_cast<double>(values.size() - 1));
}

SummaryStatistics summarize(std::vector<double> values) {
    SummaryStatistics s;
    if (values.empty()) return s;

    std::sort(values.begin(), values.end());
    s.count = static_cast<int>(values.size());
    s.mean = mean(values);
    s.median = percentile(values, 0.5);
    s.ci_lower_95 = percentile(values, 0.025);
    s.ci_upper_95 = percentile(values, 0.975);
    s.std_dev = standardDeviation(values);
    s.min = values.front();
    s.max = values.back();
    return s;
}

PercentileBand band(std::vector<double> values) {
    PercentileBand b;
    if (values.empty()) return b;

    std::sort(values.begin(), values.end());
    b.mean = mean(values);
    b.p5 = percentile(values, 0.05);
    b.p25 = percentile(values, 0.25);
    b.p50 = percentile(values, 0.50);
    b.p75 = percentile(values, 0.75);
    b.p95 = percentile(values, 0.95);
    return b;
}

std::vector<int> histogram(const std::vector<double>& values, double lo, double hi, int bins) {
    if (bins <= 0 || !(hi > lo)) {
        throw std::invalid_argument("Histogram needs bins > 0 and hi > lo");
    }
    std::vector<int> counts(bins, 0);
    const double width = (hi - lo) / bins;
    for (double v : values) {
        int b = static_cast<int>(std::floor((v - lo) / width));
        b = std::min(bins - 1, std::max(0, b));
        ++counts[b];
    }
    return counts;
}

} // namespace EnsembleStatistics
} // namespace CEED
