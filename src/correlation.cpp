#include <valuation/correlation.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <valuation/errors.hpp>

namespace valuation {

namespace {

constexpr double kSymmetryTolerance = 1e-12;
constexpr double kPivotTolerance = 1e-10;

std::string pair_name(Parameter first, Parameter second) {
    return fmt::format("correlation[{},{}]", to_string(first), to_string(second));
}

} // namespace

Eigen::MatrixXd cholesky_lower(const Eigen::MatrixXd& matrix) {
    if (matrix.rows() != matrix.cols()) {
        throw SingularCorrelationMatrix("correlation matrix must be square");
    }
    const Eigen::Index dim = matrix.rows();
    Eigen::MatrixXd L = Eigen::MatrixXd::Zero(dim, dim);

    for (Eigen::Index i = 0; i < dim; ++i) {
        for (Eigen::Index j = 0; j <= i; ++j) {
            double sum = matrix(i, j);
            for (Eigen::Index k = 0; k < j; ++k) {
                sum -= L(i, k) * L(j, k);
            }
            if (i == j) {
                if (sum < -kPivotTolerance) {
                    throw SingularCorrelationMatrix(
                        fmt::format("correlation matrix is not positive semi-definite (pivot {} = {})", i, sum));
                }
                L(i, j) = sum <= kPivotTolerance ? 0.0 : std::sqrt(sum);
            } else {
                const double diag = L(j, j);
                if (diag == 0.0) {
                    if (std::abs(sum) > kPivotTolerance) {
                        throw SingularCorrelationMatrix(
                            fmt::format("correlation matrix is not positive semi-definite (row {}, column {})", i, j));
                    }
                    L(i, j) = 0.0;
                } else {
                    L(i, j) = sum / diag;
                }
            }
        }
    }

    return L;
}

CorrelationMatrix::CorrelationMatrix(std::vector<Parameter> parameters, const std::vector<Correlation>& pairs)
    : parameters_(std::move(parameters)) {
    const auto dim = static_cast<Eigen::Index>(parameters_.size());
    matrix_ = Eigen::MatrixXd::Identity(dim, dim);

    for (const auto& pair : pairs) {
        const auto i = index_of(pair.first);
        const auto j = index_of(pair.second);
        if (!i || !j) {
            throw InvalidParameter(pair_name(pair.first, pair.second),
                                   pair.rho,
                                   "correlated parameter is not part of the matrix");
        }
        if (*i == *j) {
            if (pair.rho != 1.0) {
                throw InvalidParameter(pair_name(pair.first, pair.second), pair.rho, "self-correlation must be 1");
            }
            continue;
        }
        matrix_(static_cast<Eigen::Index>(*i), static_cast<Eigen::Index>(*j)) = pair.rho;
        matrix_(static_cast<Eigen::Index>(*j), static_cast<Eigen::Index>(*i)) = pair.rho;
    }

    check_and_factor();
}

CorrelationMatrix::CorrelationMatrix(std::vector<Parameter> parameters, Eigen::MatrixXd matrix)
    : parameters_(std::move(parameters)), matrix_(std::move(matrix)) {
    check_and_factor();
}

CorrelationMatrix CorrelationMatrix::identity(std::vector<Parameter> parameters) {
    return CorrelationMatrix(std::move(parameters), std::vector<Correlation>{});
}

std::optional<std::size_t> CorrelationMatrix::index_of(Parameter parameter) const noexcept {
    const auto it = std::find(parameters_.begin(), parameters_.end(), parameter);
    if (it == parameters_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - parameters_.begin());
}

double CorrelationMatrix::rho(Parameter first, Parameter second) const {
    const auto i = index_of(first);
    const auto j = index_of(second);
    if (!i || !j) {
        throw std::out_of_range(pair_name(first, second) + " is not part of the matrix");
    }
    return matrix_(static_cast<Eigen::Index>(*i), static_cast<Eigen::Index>(*j));
}

CorrelationMatrix CorrelationMatrix::reordered(const std::vector<Parameter>& order) const {
    for (const Parameter parameter : parameters_) {
        if (std::find(order.begin(), order.end(), parameter) == order.end()) {
            throw InvalidParameter(std::string(to_string(parameter)),
                                   0.0,
                                   "correlated parameter has no distribution");
        }
    }

    const auto dim = static_cast<Eigen::Index>(order.size());
    Eigen::MatrixXd full = Eigen::MatrixXd::Identity(dim, dim);
    for (Eigen::Index r = 0; r < dim; ++r) {
        for (Eigen::Index c = 0; c < dim; ++c) {
            const auto i = index_of(order[static_cast<std::size_t>(r)]);
            const auto j = index_of(order[static_cast<std::size_t>(c)]);
            if (i && j) {
                full(r, c) = matrix_(static_cast<Eigen::Index>(*i), static_cast<Eigen::Index>(*j));
            }
        }
    }
    return CorrelationMatrix(order, std::move(full));
}

void CorrelationMatrix::check_and_factor() {
    const auto dim = static_cast<Eigen::Index>(parameters_.size());
    if (matrix_.rows() != dim || matrix_.cols() != dim) {
        throw InvalidParameter("correlation", static_cast<double>(matrix_.rows()),
                               fmt::format("matrix must be {}x{} to match its parameters", dim, dim));
    }
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        for (std::size_t j = i + 1; j < parameters_.size(); ++j) {
            if (parameters_[i] == parameters_[j]) {
                throw InvalidParameter(std::string(to_string(parameters_[i])), 0.0, "duplicate correlated parameter");
            }
        }
    }

    for (Eigen::Index i = 0; i < dim; ++i) {
        const Parameter pi = parameters_[static_cast<std::size_t>(i)];
        if (std::abs(matrix_(i, i) - 1.0) > kSymmetryTolerance) {
            throw InvalidParameter(pair_name(pi, pi), matrix_(i, i), "diagonal entries must be 1");
        }
        for (Eigen::Index j = 0; j < i; ++j) {
            const Parameter pj = parameters_[static_cast<std::size_t>(j)];
            const double value = matrix_(i, j);
            if (!std::isfinite(value) || value < -1.0 || value > 1.0) {
                throw InvalidParameter(pair_name(pi, pj), value, "correlation must lie in [-1, 1]");
            }
            if (std::abs(value - matrix_(j, i)) > kSymmetryTolerance) {
                throw InvalidParameter(pair_name(pi, pj), value, "correlation matrix must be symmetric");
            }
        }
    }

    lower_ = cholesky_lower(matrix_);
}

} // namespace valuation
