#ifndef ENSEMBLE_STATISTICS_HPP
#define ENSEMBLE_STATISTICS_HPP

#include <vector>

namespace CEED {

/**
 * @brief Summary of a sample: mean, median, central 95% interval, spread
 */
struct SummaryStatistics {
    int count = 0;
    double mean = 0.0;
    double median = 0.0;
    double ci_lower_95 = 0.0;
    double ci_upper_95 = 0.0;
    double std_dev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

/**
 * @brief Mean and percentile band of one quantity at one step
 */
struct PercentileBand {
    double mean = 0.0;
    double p5 = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p95 = 0.0;
};

namespace EnsembleStatistics {

/**
 * @brief Percentile with linear interpolation between order statistics
 * @param sorted Values in ascending order
 * @param p Fraction in [0, 1]
 */
double percentile(const std::vector<double>& sorted, double p);

double mean(const std::vector<double>& values);

// Sample standard deviation (n - 1); 0 for fewer than two values
double standardDeviation(const std::vector<double>& values);

SummaryStatistics summarize(std::vector<double> values);

PercentileBand band(std::vector<double> values);

/**
 * @brief Equal-width histogram over [lo, hi]
 *
 * Values outside the range are clamped into the edge bins.
 */
std::vector<int> histogram(const std::vector<double>& values, double lo, double hi, int bins);

} // namespace EnsembleStatistics

} // namespace CEED

#endif // ENSEMBLE_STATISTICS_HPP
