#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <valuation/correlation.hpp>
#include <valuation/dcf.hpp>
#include <valuation/distribution.hpp>
#include <valuation/errors.hpp>
#include <valuation/monte_carlo.hpp>
#include <valuation/parameters.hpp>
#include <valuation/scenario.hpp>
#include <valuation/sensitivity.hpp>

namespace {

constexpr double kTerminalRatioWarning = 0.80;
constexpr std::size_t kHistogramWidth = 50;

std::string percent(double value) {
    return fmt::format("{:.2f}%", value * 100.0);
}

void log_projection(const valuation::DcfBreakdown& dcf) {
    spdlog::info("==================== DCF ====================");
    spdlog::info("{:>6} | {:>8} | {:>16} | {:>16}", "Year", "Growth", "Cash flow", "Present value");
    for (const auto& period : dcf.projection.periods) {
        spdlog::info("{:>6} | {:>8} | {:>16.2f} | {:>16.2f}",
                     period.period,
                     percent(period.growth_rate),
                     period.nominal,
                     period.present_value);
    }

    const auto& out = dcf.outcome;
    spdlog::info("");
    spdlog::info("  Explicit PV:      {:.2f}", out.explicit_pv);
    spdlog::info("  Terminal value:   {:.2f} (PV {:.2f})", dcf.terminal.nominal, out.terminal_pv);
    spdlog::info("  Enterprise value: {:.2f}", out.enterprise_value);
    spdlog::info("  Equity value:     {:.2f}", out.equity_value);
    spdlog::info("  Value per share:  {:.4f}", out.per_share_value);
    spdlog::info("  Terminal share:   {}", percent(out.terminal_ratio));
    if (out.terminal_ratio > kTerminalRatioWarning) {
        spdlog::warn("Terminal value is {} of enterprise value, above the {} threshold; "
                     "the valuation rests mostly on the perpetuity assumptions.",
                     percent(out.terminal_ratio),
                     percent(kTerminalRatioWarning));
    }
    if (out.equity_value < 0.0) {
        spdlog::warn("Equity value is negative: net debt exceeds enterprise value.");
    }
}

void log_grid(const valuation::SensitivityGrid& grid) {
    spdlog::info("==================== Sensitivity ====================");
    spdlog::info("Value per share: {} (rows) vs {} (columns)",
                 valuation::to_string(grid.row_parameter),
                 valuation::to_string(grid.column_parameter));

    std::string header = fmt::format("{:>10} |", "");
    for (double column : grid.column_values) {
        header += fmt::format(" {:>10} |", percent(column));
    }
    spdlog::info(header);

    for (std::size_t i = 0; i < grid.row_values.size(); ++i) {
        std::string line = fmt::format("{:>10} |", percent(grid.row_values[i]));
        for (const auto& cell : grid.cells[i]) {
            line += cell.feasible() ? fmt::format(" {:>10.2f} |", *cell.per_share_value)
                                    : fmt::format(" {:>10} |", "N/A");
        }
        spdlog::info(line);
    }

    const auto lo = grid.min_value();
    const auto hi = grid.max_value();
    if (lo && hi) {
        spdlog::info("  Range: {:.2f} - {:.2f} ({} infeasible cells)", *lo, *hi, grid.infeasible_count());
    }
}

void log_scenarios(const valuation::ScenarioAnalysis& analysis) {
    spdlog::info("==================== Scenarios ====================");
    spdlog::info("{:<12} | {:>8} | {:>14} | {:>12}", "Scenario", "Prob.", "Value/share", "Weighted");
    for (const auto& scenario : analysis.scenarios) {
        spdlog::info("{:<12} | {:>8} | {:>14.2f} | {:>12.2f}",
                     scenario.name,
                     percent(scenario.probability),
                     scenario.outcome.per_share_value,
                     scenario.weighted_value);
    }
    spdlog::info("{:<12} | {:>8} | {:>14} | {:>12.2f}",
                 "Expected",
                 percent(analysis.probability_sum),
                 "",
                 analysis.expected_value);
}

void log_simulation(const valuation::SimulationResult& result) {
    const auto& s = result.statistics;
    spdlog::info("==================== Monte Carlo ====================");
    spdlog::info("  Draws:   {} of {} requested{}",
                 result.sample_size(),
                 result.requested_iterations,
                 result.partial ? " (PARTIAL)" : "");
    if (result.rejected_draws > 0) {
        spdlog::info("  Rejected infeasible draws: {}", result.rejected_draws);
    }
    spdlog::info("  Mean:    {:.4f}", s.mean);
    spdlog::info("  Median:  {:.4f}", s.median);
    spdlog::info("  Std dev: {:.4f}", s.stddev);
    spdlog::info("  Min/Max: {:.4f} / {:.4f}", s.min, s.max);
    spdlog::info("  P5 {:.4f} | P25 {:.4f} | P75 {:.4f} | P95 {:.4f}", s.p5, s.p25, s.p75, s.p95);
    spdlog::info("  P10 {:.4f} | P90 {:.4f}", s.p10, s.p90);
    spdlog::info("  90% interval: {:.4f} - {:.4f}", s.p5, s.p95);
    spdlog::info("  50% interval: {:.4f} - {:.4f}", s.p25, s.p75);
    if (s.probability_negative > 0.0) {
        spdlog::info("  P(value < 0): {}", percent(s.probability_negative));
    }

    const auto& h = result.histogram;
    const std::size_t peak = h.counts.empty() ? 0 : *std::max_element(h.counts.begin(), h.counts.end());
    for (std::size_t b = 0; b < h.bins(); ++b) {
        const std::size_t bar = peak == 0 ? 0 : h.counts[b] * kHistogramWidth / peak;
        spdlog::info("  {:>10.2f} - {:>10.2f} | {:<{}} {}",
                     h.edges[b],
                     h.edges[b + 1],
                     std::string(bar, '#'),
                     kHistogramWidth,
                     h.counts[b]);
    }
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"valuation_risk"};
    app.set_config("--config", "", "TOML/INI file with any of the options below");

    valuation::ValuationParameters params;
    params.base_cash_flow = 66170.0;
    params.discount_rate = 0.0942;
    params.high_growth_rate = 0.12;
    params.high_growth_years = 5;
    params.transition_years = 5;
    params.terminal_growth_rate = 0.025;
    params.net_debt = -21000.0;
    params.share_count = 7430.0;

    std::string basis = "firm";
    std::optional<double> exit_multiple;
    double terminal_metric = 0.0;
    std::optional<double> stable_roic;

    std::size_t iterations = valuation::kMinimumIterations;
    valuation::MonteCarloOptions mc_options;
    double discount_rate_stddev = 0.01;
    double high_growth_stddev = 0.03;
    double growth_correlation = 0.0;
    std::optional<long long> time_budget_ms;
    bool skip_monte_carlo = false;
    std::string log_level = "info";

    app.add_option("--base-cash-flow", params.base_cash_flow, "Base-year free cash flow")->capture_default_str();
    app.add_option("--discount-rate", params.discount_rate, "WACC or cost of equity")->capture_default_str();
    app.add_option("--high-growth", params.high_growth_rate, "Phase-1 growth rate")->capture_default_str();
    app.add_option("--high-growth-years", params.high_growth_years, "Phase-1 length in years")->capture_default_str();
    app.add_option("--transition-years", params.transition_years, "Linear fade length in years")->capture_default_str();
    app.add_option("--terminal-growth", params.terminal_growth_rate, "Perpetual growth rate")->capture_default_str();
    app.add_option("--net-debt", params.net_debt, "Net debt (negative for net cash)")->capture_default_str();
    app.add_option("--shares", params.share_count, "Shares outstanding")->capture_default_str();
    app.add_option("--basis", basis, "Cash-flow basis")
        ->check(CLI::IsMember({"firm", "equity"}))
        ->capture_default_str();
    app.add_option("--exit-multiple", exit_multiple, "Use an exit-multiple terminal value");
    app.add_option("--terminal-metric", terminal_metric, "Metric the exit multiple applies to");
    app.add_option("--stable-roic", stable_roic, "Stable ROIC for the reinvestment-adjusted Gordon value");

    app.add_option("--iterations", iterations, "Monte Carlo draws")->capture_default_str();
    app.add_option("--seed", mc_options.seed, "Monte Carlo seed")->capture_default_str();
    app.add_option("--threads", mc_options.threads, "Worker threads (0 = all cores)")->capture_default_str();
    app.add_option("--bins", mc_options.histogram_bins, "Histogram bins")->capture_default_str();
    app.add_option("--block-size", mc_options.block_size, "Draws per generator block")->capture_default_str();
    app.add_flag("--keep-samples", mc_options.keep_parameter_samples, "Retain the sampled inputs");
    app.add_option("--discount-rate-stddev", discount_rate_stddev, "Stddev of the sampled discount rate")
        ->capture_default_str();
    app.add_option("--high-growth-stddev", high_growth_stddev, "Stddev of the sampled phase-1 growth")
        ->capture_default_str();
    app.add_option("--rho", growth_correlation, "Correlation between discount rate and phase-1 growth")
        ->check(CLI::Range(-1.0, 1.0))
        ->capture_default_str();
    app.add_option("--time-budget-ms", time_budget_ms, "Stop drawing after this many milliseconds");
    app.add_flag("--reject-infeasible", mc_options.reject_infeasible_draws, "Drop draws with invalid inputs");
    app.add_flag("--skip-monte-carlo", skip_monte_carlo, "Only run the deterministic analyses");
    app.add_option("--log-level", log_level, "spdlog level")->capture_default_str();

    try {
        CLI11_PARSE(app, argc, argv);

        spdlog::set_level(spdlog::level::from_str(log_level));

        params.basis = basis == "equity" ? valuation::CashFlowBasis::Equity : valuation::CashFlowBasis::Firm;
        if (exit_multiple) {
            params.terminal_method = valuation::ExitMultiple{*exit_multiple, terminal_metric};
        } else {
            params.terminal_method = valuation::GordonGrowth{stable_roic};
        }
        if (time_budget_ms) {
            mc_options.time_budget = std::chrono::milliseconds(*time_budget_ms);
        }

        const auto dcf = valuation::evaluate_detailed(params);
        log_projection(dcf);

        const auto grid = valuation::sensitivity_grid(params,
                                                      valuation::Parameter::DiscountRate,
                                                      valuation::centered_range(params.discount_rate, 0.005, 7),
                                                      valuation::Parameter::TerminalGrowthRate,
                                                      valuation::centered_range(params.terminal_growth_rate, 0.005, 5));
        log_grid(grid);

        const std::vector<valuation::ScenarioDefinition> scenarios{
            {"Bear", 0.25, {{valuation::Parameter::HighGrowthRate, params.high_growth_rate * 0.5},
                            {valuation::Parameter::DiscountRate, params.discount_rate + 0.01}}},
            {"Base", 0.55, {}},
            {"Bull", 0.20, {{valuation::Parameter::HighGrowthRate, params.high_growth_rate * 1.35}}},
        };
        log_scenarios(valuation::evaluate_scenarios(params, scenarios));

        if (!skip_monte_carlo) {
            valuation::DistributionMap distributions{
                {valuation::Parameter::DiscountRate, valuation::Normal{params.discount_rate, discount_rate_stddev}},
                {valuation::Parameter::HighGrowthRate, valuation::Normal{params.high_growth_rate, high_growth_stddev}},
            };
            if (params.uses_gordon_growth()) {
                const double g = params.terminal_growth_rate;
                distributions.emplace(valuation::Parameter::TerminalGrowthRate,
                                      valuation::Triangular{g - 0.01, g, g + 0.01});
            }
            for (const auto& [parameter, dist] : distributions) {
                spdlog::info("Sampling {} ~ {}", valuation::to_string(parameter), valuation::describe(dist));
            }

            const valuation::CorrelationMatrix correlation(
                {valuation::Parameter::DiscountRate, valuation::Parameter::HighGrowthRate},
                std::vector<valuation::Correlation>{
                    {valuation::Parameter::DiscountRate, valuation::Parameter::HighGrowthRate, growth_correlation}});

            log_simulation(valuation::simulate(params, distributions, correlation, iterations, mc_options));
        }
    } catch (const CLI::ParseError& parse_error) {
        return app.exit(parse_error);
    } catch (const std::exception& ex) {
        spdlog::error("Valuation failed: {}", ex.what());
        return 1;
    }

    return 0;
}
