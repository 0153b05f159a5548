#pragma once

#include <optional>

#include <valuation/parameters.hpp>

namespace valuation {

struct TerminalValue {
    double nominal = 0.0;
    double present_value = 0.0;
    // present_value / enterprise value; filled in by the DCF once the
    // explicit flows are known. Callers flag values above ~0.80.
    double ratio_of_enterprise_value = 0.0;
};

// FCF_last * (1 + g) / (r - g); with a stable ROIC the terminal flow is
// scaled by (1 - g / ROIC).
double gordon_growth_value(double last_flow,
                           double terminal_growth,
                           double discount_rate,
                           std::optional<double> stable_roic = std::nullopt);

double exit_multiple_value(double terminal_metric, double multiple);

TerminalValue compute_terminal_value(const TerminalMethod& method,
                                     double last_flow,
                                     double terminal_growth,
                                     double discount_rate,
                                     int horizon_years);

} // namespace valuation
