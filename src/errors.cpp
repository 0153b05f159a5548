#include <valuation/errors.hpp>

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace valuation {

InvalidParameter::InvalidParameter(std::string field, double value, const std::string& reason)
    : std::invalid_argument(fmt::format("invalid {} ({}): {}", field, value, reason)),
      field_(std::move(field)),
      value_(value) {}

InconsistentProbabilities::InconsistentProbabilities(double probability_sum)
    : std::invalid_argument(fmt::format("scenario probabilities sum to {:.8f}, expected 1", probability_sum)),
      probability_sum_(probability_sum) {}

InsufficientIterations::InsufficientIterations(std::size_t achieved,
                                               std::size_t minimum,
                                               const std::string& reason)
    : std::invalid_argument(fmt::format("{}: {} draws, minimum is {}", reason, achieved, minimum)),
      achieved_(achieved),
      minimum_(minimum) {}

} // namespace valuation
