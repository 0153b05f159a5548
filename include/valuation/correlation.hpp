#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <Eigen/Dense>

#include <valuation/parameters.hpp>

namespace valuation {

struct Correlation {
    Parameter first = Parameter::DiscountRate;
    Parameter second = Parameter::HighGrowthRate;
    double rho = 0.0;
};

// Symmetric, unit-diagonal, positive semi-definite. Construction factors the
// matrix and throws SingularCorrelationMatrix when it is not PSD.
class CorrelationMatrix {
public:
    CorrelationMatrix() = default;
    CorrelationMatrix(std::vector<Parameter> parameters, const std::vector<Correlation>& pairs);
    CorrelationMatrix(std::vector<Parameter> parameters, Eigen::MatrixXd matrix);

    static CorrelationMatrix identity(std::vector<Parameter> parameters);

    const std::vector<Parameter>& parameters() const noexcept { return parameters_; }
    const Eigen::MatrixXd& matrix() const noexcept { return matrix_; }
    const Eigen::MatrixXd& cholesky_factor() const noexcept { return lower_; }
    [[nodiscard]] std::size_t size() const noexcept { return parameters_.size(); }

    std::optional<std::size_t> index_of(Parameter parameter) const noexcept;
    double rho(Parameter first, Parameter second) const;

    // Same correlations laid out over `order`; parameters missing from this
    // matrix are uncorrelated with everything else.
    CorrelationMatrix reordered(const std::vector<Parameter>& order) const;

private:
    void check_and_factor();

    std::vector<Parameter> parameters_;
    Eigen::MatrixXd matrix_;
    Eigen::MatrixXd lower_;
};

// Lower-triangular L with L * L^T = matrix. Zero pivots (rank-deficient PSD
// input, e.g. rho = +/-1) are accepted; negative pivots are not.
Eigen::MatrixXd cholesky_lower(const Eigen::MatrixXd& matrix);

} // namespace valuation
