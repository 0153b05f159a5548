#include <valuation/monte_carlo.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <future>
#include <random>
#include <string>
#include <thread>
#include <utility>

#include <valuation/dcf.hpp>
#include <valuation/errors.hpp>

namespace valuation {

namespace {

struct BlockResult {
    std::size_t index = 0;
    std::size_t attempted = 0;
    std::size_t rejected = 0;
    std::vector<double> values;
    std::vector<std::vector<double>> samples;  // [parameter][draw]
};

struct SimulationPlan {
    const ValuationParameters* base = nullptr;
    std::vector<Parameter> parameters;
    std::vector<DistributionSpec> distributions;
    Eigen::MatrixXd lower;
    std::size_t iterations = 0;
    std::size_t block_size = 0;
    std::size_t block_count = 0;
    std::uint64_t seed = 0;
    bool reject_infeasible = false;
    bool keep_samples = false;
};

std::mt19937_64 block_generator(std::uint64_t seed, std::size_t block) {
    const auto block64 = static_cast<std::uint64_t>(block);
    std::seed_seq seq{static_cast<std::uint32_t>(seed),
                      static_cast<std::uint32_t>(seed >> 32U),
                      static_cast<std::uint32_t>(block64),
                      static_cast<std::uint32_t>(block64 >> 32U)};
    return std::mt19937_64(seq);
}

BlockResult run_block(const SimulationPlan& plan, std::size_t block) {
    const std::size_t first = block * plan.block_size;
    const std::size_t count = std::min(plan.block_size, plan.iterations - first);
    const std::size_t dim = plan.parameters.size();
    const auto edim = static_cast<Eigen::Index>(dim);

    BlockResult result;
    result.index = block;
    result.values.reserve(count);
    if (plan.keep_samples) {
        result.samples.assign(dim, std::vector<double>());
        for (auto& series : result.samples) {
            series.reserve(count);
        }
    }

    std::mt19937_64 rng = block_generator(plan.seed, block);
    std::normal_distribution<double> norm01(0.0, 1.0);
    Eigen::VectorXd z(edim);
    Eigen::VectorXd correlated(edim);

    for (std::size_t draw = 0; draw < count; ++draw) {
        for (Eigen::Index i = 0; i < edim; ++i) {
            z(i) = norm01(rng);
        }
        correlated.noalias() = plan.lower * z;

        ValuationParameters point = *plan.base;
        for (std::size_t k = 0; k < dim; ++k) {
            const double value = sample(plan.distributions[k], correlated(static_cast<Eigen::Index>(k)));
            set_parameter(point, plan.parameters[k], value);
            if (plan.keep_samples) {
                result.samples[k].push_back(value);
            }
        }

        ++result.attempted;
        try {
            result.values.push_back(evaluate(point).per_share_value);
        } catch (const InvalidParameter& ex) {
            if (!plan.reject_infeasible) {
                spdlog::debug("Monte Carlo draw {} infeasible: {}", first + draw, ex.what());
                throw InvalidParameter(ex.field(),
                                       ex.value(),
                                       fmt::format("Monte Carlo draw {} is infeasible", first + draw));
            }
            ++result.rejected;
        }
    }

    return result;
}

void validate_inputs(const ValuationParameters& base,
                     const DistributionMap& distributions,
                     std::size_t iterations,
                     const MonteCarloOptions& options) {
    if (iterations < kMinimumIterations) {
        throw InsufficientIterations(iterations, kMinimumIterations, "requested sample size is below the minimum");
    }
    if (options.histogram_bins == 0) {
        throw InvalidParameter("histogram_bins", 0.0, "must be positive");
    }
    if (options.block_size == 0) {
        throw InvalidParameter("block_size", 0.0, "must be positive");
    }
    if (options.time_budget && options.time_budget->count() <= 0) {
        throw InvalidParameter("time_budget_ms",
                               static_cast<double>(options.time_budget->count()),
                               "must be positive");
    }

    base.validate();

    for (const auto& [parameter, dist] : distributions) {
        const std::string field(to_string(parameter));
        if (is_integral_parameter(parameter)) {
            throw InvalidParameter(field, parameter_value(base, parameter), "year counts cannot be sampled");
        }
        if (parameter == Parameter::ExitMultiple && base.uses_gordon_growth()) {
            throw InvalidParameter(field, 0.0, "parameters do not use the exit-multiple terminal method");
        }
        validate(dist, field);
    }
}

} // namespace

SimulationResult simulate(const ValuationParameters& base,
                          const DistributionMap& distributions,
                          const CorrelationMatrix& correlation,
                          std::size_t iterations,
                          const MonteCarloOptions& options) {
    validate_inputs(base, distributions, iterations, options);

    SimulationPlan plan;
    plan.base = &base;
    for (const auto& [parameter, dist] : distributions) {
        plan.parameters.push_back(parameter);
        plan.distributions.push_back(dist);
    }
    plan.lower = correlation.reordered(plan.parameters).cholesky_factor();
    plan.iterations = iterations;
    plan.block_size = std::min(options.block_size, iterations);
    plan.block_count = iterations / plan.block_size + (iterations % plan.block_size != 0 ? 1 : 0);
    plan.seed = options.seed;
    plan.reject_infeasible = options.reject_infeasible_draws;
    plan.keep_samples = options.keep_parameter_samples;

    unsigned threads = options.threads != 0 ? options.threads : std::thread::hardware_concurrency();
    threads = std::max(1U, threads);
    threads = static_cast<unsigned>(std::min<std::size_t>(threads, plan.block_count));

    spdlog::debug("Monte Carlo: {} draws over {} parameters in {} blocks on {} workers (seed {}).",
                  iterations,
                  plan.parameters.size(),
                  plan.block_count,
                  threads,
                  plan.seed);

    const auto started = std::chrono::steady_clock::now();
    std::atomic<std::size_t> next_block{0};
    std::atomic<bool> failed{false};
    std::atomic<bool> interrupted{false};

    auto should_stop = [&]() {
        if (failed.load() || options.stop.stop_requested()) {
            return true;
        }
        return options.time_budget && std::chrono::steady_clock::now() - started >= *options.time_budget;
    };

    auto worker = [&]() {
        std::vector<BlockResult> local;
        while (next_block.load() < plan.block_count) {
            if (should_stop()) {
                interrupted.store(true);
                break;
            }
            // Claimed blocks always run to completion, so finished blocks
            // form a prefix of the draw sequence.
            const std::size_t block = next_block.fetch_add(1);
            if (block >= plan.block_count) {
                break;
            }
            try {
                local.push_back(run_block(plan, block));
            } catch (const std::exception&) {
                failed.store(true);
                throw;
            }
        }
        return local;
    };

    std::vector<std::future<std::vector<BlockResult>>> futures;
    futures.reserve(threads);
    for (unsigned t = 0; t < threads; ++t) {
        futures.emplace_back(std::async(std::launch::async, worker));
    }

    std::vector<BlockResult> blocks;
    blocks.reserve(plan.block_count);
    std::exception_ptr first_error;
    for (auto& future : futures) {
        try {
            auto local = future.get();
            for (auto& block : local) {
                blocks.push_back(std::move(block));
            }
        } catch (const std::exception&) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    std::sort(blocks.begin(), blocks.end(), [](const BlockResult& a, const BlockResult& b) {
        return a.index < b.index;
    });

    std::size_t attempted = 0;
    for (const auto& block : blocks) {
        attempted += block.attempted;
    }

    SimulationResult result;
    result.requested_iterations = iterations;
    result.values.reserve(attempted);
    if (plan.keep_samples) {
        for (const Parameter parameter : plan.parameters) {
            result.parameter_samples[parameter].reserve(attempted);
        }
    }
    for (const auto& block : blocks) {
        result.completed_iterations += block.attempted;
        result.rejected_draws += block.rejected;
        result.values.insert(result.values.end(), block.values.begin(), block.values.end());
        if (plan.keep_samples) {
            for (std::size_t k = 0; k < plan.parameters.size(); ++k) {
                auto& series = result.parameter_samples[plan.parameters[k]];
                series.insert(series.end(), block.samples[k].begin(), block.samples[k].end());
            }
        }
    }

    if (result.completed_iterations < iterations) {
        if (result.completed_iterations < kMinimumIterations) {
            throw InsufficientIterations(result.completed_iterations,
                                         kMinimumIterations,
                                         "simulation interrupted before reaching the minimum sample size");
        }
        spdlog::warn("Monte Carlo interrupted after {} of {} draws; result is partial.",
                     result.completed_iterations,
                     iterations);
    }
    if (result.values.size() < kMinimumIterations) {
        throw InsufficientIterations(result.values.size(),
                                     kMinimumIterations,
                                     "too many infeasible draws were rejected");
    }
    if (result.rejected_draws > 0) {
        spdlog::warn("Monte Carlo rejected {} infeasible draws of {}.", result.rejected_draws, result.completed_iterations);
    }
    result.partial = result.values.size() < iterations;

    std::sort(result.values.begin(), result.values.end());
    result.statistics = summarize_sorted(result.values);
    result.histogram = build_histogram(result.values, options.histogram_bins);

    spdlog::debug("Monte Carlo finished: {} values, mean {:.4f}, median {:.4f}{}.",
                  result.values.size(),
                  result.statistics.mean,
                  result.statistics.median,
                  interrupted.load() ? " (interrupted)" : "");
    return result;
}

} // namespace valuation
