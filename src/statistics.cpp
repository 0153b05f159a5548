#include <valuation/statistics.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace valuation {

double quantile_sorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        throw std::invalid_argument("quantile_sorted requires non-empty data");
    }
    if (!std::isfinite(q)) {
        throw std::invalid_argument("quantile_sorted requires finite q");
    }

    q = std::clamp(q, 0.0, 1.0);
    const std::size_t n = sorted.size();
    if (n == 1) {
        return sorted.front();
    }

    const double rank = q * static_cast<double>(n - 1);
    const auto lo = static_cast<std::size_t>(std::floor(rank));
    const std::size_t hi = std::min(lo + 1, n - 1);
    const double frac = rank - static_cast<double>(lo);
    if (frac == 0.0 || sorted[lo] == sorted[hi]) {
        return sorted[lo];
    }
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

SummaryStatistics summarize_sorted(const std::vector<double>& sorted) {
    if (sorted.empty()) {
        throw std::invalid_argument("summarize_sorted requires non-empty data");
    }

    SummaryStatistics stats;
    const std::size_t n = sorted.size();
    stats.count = n;
    stats.min = sorted.front();
    stats.max = sorted.back();

    // Shift by the minimum so that identical values give an exact mean and a
    // zero deviation.
    const double shift = stats.min;
    double shifted_sum = 0.0;
    std::size_t negatives = 0;
    for (double value : sorted) {
        shifted_sum += value - shift;
        if (value < 0.0) {
            ++negatives;
        }
    }
    const double shifted_mean = shifted_sum / static_cast<double>(n);
    stats.mean = shift + shifted_mean;

    double squares = 0.0;
    for (double value : sorted) {
        const double diff = (value - shift) - shifted_mean;
        squares += diff * diff;
    }
    stats.stddev = std::sqrt(squares / static_cast<double>(n));

    stats.median = quantile_sorted(sorted, 0.50);
    stats.p5 = quantile_sorted(sorted, 0.05);
    stats.p10 = quantile_sorted(sorted, 0.10);
    stats.p25 = quantile_sorted(sorted, 0.25);
    stats.p75 = quantile_sorted(sorted, 0.75);
    stats.p90 = quantile_sorted(sorted, 0.90);
    stats.p95 = quantile_sorted(sorted, 0.95);
    stats.probability_negative = static_cast<double>(negatives) / static_cast<double>(n);
    return stats;
}

Histogram build_histogram(const std::vector<double>& sorted, std::size_t bins) {
    if (bins == 0) {
        throw std::invalid_argument("histogram requires at least one bin");
    }

    Histogram histogram;
    histogram.counts.assign(bins, 0);
    histogram.edges.assign(bins + 1, 0.0);
    if (sorted.empty()) {
        return histogram;
    }

    const double lo = sorted.front();
    const double hi = sorted.back();
    const double width = (hi - lo) / static_cast<double>(bins);
    for (std::size_t b = 0; b <= bins; ++b) {
        histogram.edges[b] = b == bins ? hi : lo + width * static_cast<double>(b);
    }

    for (double value : sorted) {
        std::size_t bin = 0;
        if (width > 0.0) {
            bin = static_cast<std::size_t>((value - lo) / width);
            bin = std::min(bin, bins - 1);
        }
        ++histogram.counts[bin];
    }
    return histogram;
}

double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) {
        throw std::invalid_argument("pearson_correlation requires two series of equal length >= 2");
    }
    const auto n = static_cast<double>(x.size());
    double mean_x = 0.0;
    double mean_y = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= n;
    mean_y /= n;

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mean_x;
        const double dy = y[i] - mean_y;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx == 0.0 || syy == 0.0) {
        throw std::invalid_argument("pearson_correlation is undefined for a constant series");
    }
    return sxy / std::sqrt(sxx * syy);
}

} // namespace valuation
