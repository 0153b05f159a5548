#pragma once

#include <cstddef>
#include <vector>

namespace valuation {

struct SummaryStatistics {
    std::size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double stddev = 0.0;  // population
    double min = 0.0;
    double max = 0.0;
    double p5 = 0.0;
    double p10 = 0.0;
    double p25 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double probability_negative = 0.0;
};

struct Histogram {
    std::vector<double> edges;          // bins + 1 ascending edges
    std::vector<std::size_t> counts;    // per bin

    [[nodiscard]] std::size_t bins() const noexcept { return counts.size(); }
};

// Linear interpolation between closest ranks; sorted must be ascending.
double quantile_sorted(const std::vector<double>& sorted, double q);

SummaryStatistics summarize_sorted(const std::vector<double>& sorted);

// Equal-width bins over [min, max]; the max value falls in the last bin. A
// zero-width range puts every value in the first bin.
Histogram build_histogram(const std::vector<double>& sorted, std::size_t bins);

double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y);

} // namespace valuation
