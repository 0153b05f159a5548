#pragma once

#include <string>
#include <vector>

#include <valuation/dcf.hpp>
#include <valuation/parameters.hpp>

namespace valuation {

inline constexpr double kProbabilityTolerance = 1e-6;

struct ScenarioDefinition {
    std::string name;
    double probability = 0.0;  // (0, 1]
    ParameterOverrides overrides;
};

struct ScenarioOutcome {
    std::string name;
    double probability = 0.0;
    ValuationOutcome outcome;
    double weighted_value = 0.0;  // probability * per-share value
};

struct ScenarioAnalysis {
    std::vector<ScenarioOutcome> scenarios;  // in input order
    double expected_value = 0.0;             // per share
    double expected_equity_value = 0.0;
    double probability_sum = 0.0;
};

ScenarioAnalysis evaluate_scenarios(const ValuationParameters& base,
                                    const std::vector<ScenarioDefinition>& scenarios);

} // namespace valuation
