#include <valuation/sensitivity.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <valuation/dcf.hpp>
#include <valuation/errors.hpp>

namespace valuation {

namespace {

void require_axis(const ValuationParameters& base, Parameter parameter) {
    if (parameter == Parameter::ExitMultiple && base.uses_gordon_growth()) {
        throw InvalidParameter("exit_multiple", 0.0, "parameters do not use the exit-multiple terminal method");
    }
}

} // namespace

const SensitivityCell& SensitivityGrid::at(std::size_t row, std::size_t column) const {
    if (row >= cells.size() || column >= cells[row].size()) {
        throw std::out_of_range("sensitivity cell index out of range");
    }
    return cells[row][column];
}

std::size_t SensitivityGrid::infeasible_count() const noexcept {
    std::size_t count = 0;
    for (const auto& row : cells) {
        count += static_cast<std::size_t>(std::count_if(row.begin(), row.end(), [](const SensitivityCell& cell) {
            return !cell.feasible();
        }));
    }
    return count;
}

std::optional<double> SensitivityGrid::min_value() const noexcept {
    std::optional<double> result;
    for (const auto& row : cells) {
        for (const auto& cell : row) {
            if (cell.feasible() && (!result || *cell.per_share_value < *result)) {
                result = cell.per_share_value;
            }
        }
    }
    return result;
}

std::optional<double> SensitivityGrid::max_value() const noexcept {
    std::optional<double> result;
    for (const auto& row : cells) {
        for (const auto& cell : row) {
            if (cell.feasible() && (!result || *cell.per_share_value > *result)) {
                result = cell.per_share_value;
            }
        }
    }
    return result;
}

std::optional<double> SensitivityGrid::central_value() const noexcept {
    if (cells.empty() || cells.front().empty()) {
        return std::nullopt;
    }
    const auto& row = cells[cells.size() / 2];
    return row[row.size() / 2].per_share_value;
}

SensitivityGrid sensitivity_grid(const ValuationParameters& base,
                                 Parameter param_a,
                                 const std::vector<double>& values_a,
                                 Parameter param_b,
                                 const std::vector<double>& values_b) {
    if (param_a == param_b) {
        throw InvalidParameter(std::string(to_string(param_a)),
                               parameter_value(base, param_a),
                               "sensitivity axes must vary two different parameters");
    }
    if (values_a.empty()) {
        throw InvalidParameter(std::string(to_string(param_a)), 0.0, "row axis has no values");
    }
    if (values_b.empty()) {
        throw InvalidParameter(std::string(to_string(param_b)), 0.0, "column axis has no values");
    }

    // Only the varied fields may make a cell infeasible; anything else wrong
    // with the base is an error for the whole grid.
    require_axis(base, param_a);
    require_axis(base, param_b);
    base.validate_except({param_a, param_b});

    SensitivityGrid grid;
    grid.row_parameter = param_a;
    grid.column_parameter = param_b;
    grid.row_values = values_a;
    grid.column_values = values_b;
    grid.cells.assign(values_a.size(), std::vector<SensitivityCell>(values_b.size()));

    for (std::size_t i = 0; i < values_a.size(); ++i) {
        for (std::size_t j = 0; j < values_b.size(); ++j) {
            SensitivityCell& cell = grid.cells[i][j];
            try {
                ValuationParameters point = base;
                set_parameter(point, param_a, values_a[i]);
                set_parameter(point, param_b, values_b[j]);
                cell.per_share_value = evaluate(point).per_share_value;
            } catch (const InvalidParameter& ex) {
                cell.error = ex.what();
                spdlog::debug("sensitivity cell ({}={}, {}={}) infeasible: {}",
                              to_string(param_a),
                              values_a[i],
                              to_string(param_b),
                              values_b[j],
                              ex.what());
            }
        }
    }

    return grid;
}

std::vector<double> centered_range(double center, double step, std::size_t count) {
    if (!std::isfinite(center) || !std::isfinite(step) || step <= 0.0) {
        throw InvalidParameter("step", step, "range step must be finite and positive");
    }
    if (count == 0) {
        throw InvalidParameter("count", 0.0, "range must contain at least one value");
    }
    std::vector<double> values(count, 0.0);
    const double offset = static_cast<double>(count - 1) / 2.0;
    for (std::size_t i = 0; i < count; ++i) {
        values[i] = center + (static_cast<double>(i) - offset) * step;
    }
    return values;
}

} // namespace valuation
