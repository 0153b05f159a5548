#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stop_token>
#include <vector>

#include <valuation/correlation.hpp>
#include <valuation/distribution.hpp>
#include <valuation/parameters.hpp>
#include <valuation/statistics.hpp>

namespace valuation {

inline constexpr std::size_t kMinimumIterations = 10000;

using DistributionMap = std::map<Parameter, DistributionSpec>;

struct MonteCarloOptions {
    std::uint64_t seed = 42;
    unsigned threads = 0;             // 0 = hardware concurrency
    std::size_t histogram_bins = 20;
    std::size_t block_size = 1000;    // draws per generator block
    bool reject_infeasible_draws = false;
    bool keep_parameter_samples = false;
    std::optional<std::chrono::milliseconds> time_budget;
    std::stop_token stop;
};

struct SimulationResult {
    std::vector<double> values;  // per-share values, ascending
    SummaryStatistics statistics;
    Histogram histogram;
    std::size_t requested_iterations = 0;
    std::size_t completed_iterations = 0;  // draws attempted before any interruption
    std::size_t rejected_draws = 0;
    bool partial = false;
    // Raw sampled inputs in draw order; filled when keep_parameter_samples is set.
    std::map<Parameter, std::vector<double>> parameter_samples;

    [[nodiscard]] std::size_t sample_size() const noexcept { return values.size(); }
};

// Draws correlated inputs, evaluates the DCF per draw and aggregates. Parameters
// absent from `correlation` are sampled independently.
SimulationResult simulate(const ValuationParameters& base,
                          const DistributionMap& distributions,
                          const CorrelationMatrix& correlation,
                          std::size_t iterations,
                          const MonteCarloOptions& options = {});

} // namespace valuation
