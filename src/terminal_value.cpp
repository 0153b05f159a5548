#include <valuation/terminal_value.hpp>

#include <cmath>
#include <variant>

#include <valuation/cash_flows.hpp>
#include <valuation/errors.hpp>

namespace valuation {

double gordon_growth_value(double last_flow,
                           double terminal_growth,
                           double discount_rate,
                           std::optional<double> stable_roic) {
    if (!std::isfinite(last_flow)) {
        throw InvalidParameter("last_flow", last_flow, "must be finite");
    }
    if (!std::isfinite(terminal_growth) || !std::isfinite(discount_rate)) {
        throw InvalidParameter("terminal_growth_rate", terminal_growth, "rates must be finite");
    }
    if (terminal_growth >= discount_rate) {
        throw InvalidParameter("terminal_growth_rate",
                               terminal_growth,
                               "must be below the discount rate for a Gordon terminal value");
    }

    double terminal_flow = last_flow * (1.0 + terminal_growth);
    if (stable_roic) {
        if (!std::isfinite(*stable_roic) || *stable_roic <= 0.0) {
            throw InvalidParameter("stable_roic", *stable_roic, "must be finite and positive");
        }
        terminal_flow *= 1.0 - terminal_growth / *stable_roic;
    }
    return terminal_flow / (discount_rate - terminal_growth);
}

double exit_multiple_value(double terminal_metric, double multiple) {
    if (!std::isfinite(terminal_metric) || terminal_metric <= 0.0) {
        throw InvalidParameter("terminal_metric", terminal_metric, "must be finite and positive");
    }
    if (!std::isfinite(multiple) || multiple <= 0.0) {
        throw InvalidParameter("exit_multiple", multiple, "must be finite and positive");
    }
    return terminal_metric * multiple;
}

TerminalValue compute_terminal_value(const TerminalMethod& method,
                                     double last_flow,
                                     double terminal_growth,
                                     double discount_rate,
                                     int horizon_years) {
    TerminalValue tv;
    if (const auto* gordon = std::get_if<GordonGrowth>(&method)) {
        tv.nominal = gordon_growth_value(last_flow, terminal_growth, discount_rate, gordon->stable_roic);
    } else {
        const auto& exit = std::get<ExitMultiple>(method);
        tv.nominal = exit_multiple_value(exit.terminal_metric, exit.multiple);
    }
    tv.present_value = present_value(tv.nominal, discount_rate, horizon_years);
    return tv;
}

} // namespace valuation
