#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <valuation/parameters.hpp>

namespace valuation {

struct SensitivityCell {
    std::optional<double> per_share_value;
    std::string error;  // InvalidParameter message when infeasible

    bool feasible() const noexcept { return per_share_value.has_value(); }
};

struct SensitivityGrid {
    Parameter row_parameter = Parameter::DiscountRate;
    Parameter column_parameter = Parameter::TerminalGrowthRate;
    std::vector<double> row_values;
    std::vector<double> column_values;
    std::vector<std::vector<SensitivityCell>> cells;  // cells[row][column]

    const SensitivityCell& at(std::size_t row, std::size_t column) const;
    std::size_t infeasible_count() const noexcept;
    std::optional<double> min_value() const noexcept;
    std::optional<double> max_value() const noexcept;
    // Value at the middle row and column, if that cell is feasible.
    std::optional<double> central_value() const noexcept;
};

// Row/column order follows values_a/values_b exactly. An override that makes a
// point infeasible is recorded on that cell; the rest of the grid is filled.
SensitivityGrid sensitivity_grid(const ValuationParameters& base,
                                 Parameter param_a,
                                 const std::vector<double>& values_a,
                                 Parameter param_b,
                                 const std::vector<double>& values_b);

// count values spaced by step, centred on center (ascending).
std::vector<double> centered_range(double center, double step, std::size_t count);

} // namespace valuation
