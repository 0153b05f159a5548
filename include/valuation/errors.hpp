#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace valuation {

class InvalidParameter : public std::invalid_argument {
public:
    InvalidParameter(std::string field, double value, const std::string& reason);

    const std::string& field() const noexcept { return field_; }
    double value() const noexcept { return value_; }

private:
    std::string field_;
    double value_;
};

class InconsistentProbabilities : public std::invalid_argument {
public:
    explicit InconsistentProbabilities(double probability_sum);

    double probability_sum() const noexcept { return probability_sum_; }

private:
    double probability_sum_;
};

class InsufficientIterations : public std::invalid_argument {
public:
    InsufficientIterations(std::size_t achieved, std::size_t minimum, const std::string& reason);

    std::size_t achieved() const noexcept { return achieved_; }
    std::size_t minimum() const noexcept { return minimum_; }

private:
    std::size_t achieved_;
    std::size_t minimum_;
};

class SingularCorrelationMatrix : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace valuation
