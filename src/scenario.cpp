#include <valuation/scenario.hpp>

#include <cmath>
#include <utility>

#include <valuation/errors.hpp>

namespace valuation {

ScenarioAnalysis evaluate_scenarios(const ValuationParameters& base,
                                    const std::vector<ScenarioDefinition>& scenarios) {
    double probability_sum = 0.0;
    for (const auto& scenario : scenarios) {
        if (!std::isfinite(scenario.probability) || scenario.probability <= 0.0 || scenario.probability > 1.0) {
            throw InvalidParameter("probability[" + scenario.name + "]",
                                   scenario.probability,
                                   "scenario probability must lie in (0, 1]");
        }
        probability_sum += scenario.probability;
    }
    if (std::abs(probability_sum - 1.0) > kProbabilityTolerance) {
        throw InconsistentProbabilities(probability_sum);
    }

    ScenarioAnalysis analysis;
    analysis.probability_sum = probability_sum;
    analysis.scenarios.reserve(scenarios.size());

    for (const auto& scenario : scenarios) {
        ScenarioOutcome result;
        result.name = scenario.name;
        result.probability = scenario.probability;
        result.outcome = evaluate(with_overrides(base, scenario.overrides));
        result.weighted_value = scenario.probability * result.outcome.per_share_value;

        analysis.expected_value += result.weighted_value;
        analysis.expected_equity_value += scenario.probability * result.outcome.equity_value;
        analysis.scenarios.push_back(std::move(result));
    }

    return analysis;
}

} // namespace valuation
