#include <valuation/cash_flows.hpp>

#include <cmath>

#include <valuation/errors.hpp>
#include <valuation/parameters.hpp>

namespace valuation {

double CashFlowProjection::total_present_value() const noexcept {
    double total = 0.0;
    for (const auto& period : periods) {
        total += period.present_value;
    }
    return total;
}

double CashFlowProjection::last_flow(double base_flow) const noexcept {
    return periods.empty() ? base_flow : periods.back().nominal;
}

std::vector<double> growth_schedule(double growth_phase1,
                                    int years_phase1,
                                    int years_transition,
                                    double growth_terminal) {
    if (years_phase1 < 0 || years_phase1 > kMaxYears) {
        throw InvalidParameter("high_growth_years", years_phase1, "year count out of range [0, 1000]");
    }
    if (years_transition < 0 || years_transition > kMaxYears) {
        throw InvalidParameter("transition_years", years_transition, "year count out of range [0, 1000]");
    }

    std::vector<double> rates;
    rates.reserve(static_cast<std::size_t>(years_phase1) + static_cast<std::size_t>(years_transition));
    rates.insert(rates.end(), static_cast<std::size_t>(years_phase1), growth_phase1);

    const double step = growth_terminal - growth_phase1;
    for (int i = 1; i <= years_transition; ++i) {
        if (i == years_transition) {
            rates.push_back(growth_terminal);
        } else {
            rates.push_back(growth_phase1 + step * (static_cast<double>(i) / static_cast<double>(years_transition)));
        }
    }
    return rates;
}

double present_value(double future_value, double rate, int periods) {
    if (!(rate > -1.0)) {
        throw InvalidParameter("discount_rate", rate, "must be greater than -100%");
    }
    if (periods < 0) {
        throw InvalidParameter("periods", periods, "must not be negative");
    }
    return future_value / std::pow(1.0 + rate, static_cast<double>(periods));
}

CashFlowProjection project_cash_flows(double base_flow,
                                      double growth_phase1,
                                      int years_phase1,
                                      int years_transition,
                                      double growth_terminal,
                                      double discount_rate) {
    if (!std::isfinite(base_flow) || base_flow <= 0.0) {
        throw InvalidParameter("base_cash_flow", base_flow, "must be finite and positive");
    }
    if (!std::isfinite(discount_rate) || discount_rate <= 0.0) {
        throw InvalidParameter("discount_rate", discount_rate, "must be finite and positive");
    }

    const std::vector<double> rates = growth_schedule(growth_phase1, years_phase1, years_transition, growth_terminal);

    CashFlowProjection projection;
    projection.periods.reserve(rates.size());

    double flow = base_flow;
    for (std::size_t i = 0; i < rates.size(); ++i) {
        const int period = static_cast<int>(i + 1);
        flow *= 1.0 + rates[i];
        projection.periods.push_back(ProjectedCashFlow{
            .period = period,
            .growth_rate = rates[i],
            .nominal = flow,
            .present_value = present_value(flow, discount_rate, period)});
    }
    return projection;
}

double free_cash_flow_to_firm(double ebit,
                              double tax_rate,
                              double capex,
                              double depreciation,
                              double delta_working_capital) {
    if (!(tax_rate >= 0.0 && tax_rate <= 1.0)) {
        throw InvalidParameter("tax_rate", tax_rate, "must lie in [0, 1]");
    }
    return ebit * (1.0 - tax_rate) + depreciation - capex - delta_working_capital;
}

double free_cash_flow_to_equity(double net_income,
                                double depreciation,
                                double capex,
                                double delta_working_capital,
                                double net_debt_repayment) {
    return net_income + depreciation - capex - delta_working_capital - net_debt_repayment;
}

} // namespace valuation
