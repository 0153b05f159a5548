#pragma once

#include <cstddef>
#include <vector>

namespace valuation {

struct ProjectedCashFlow {
    int period = 0;               // 1-based year
    double growth_rate = 0.0;     // rate applied to reach this period's flow
    double nominal = 0.0;
    double present_value = 0.0;
};

struct CashFlowProjection {
    std::vector<ProjectedCashFlow> periods;  // chronological

    [[nodiscard]] std::size_t size() const noexcept { return periods.size(); }
    double total_present_value() const noexcept;
    // Last projected flow, or the base flow when the horizon is empty.
    double last_flow(double base_flow) const noexcept;
};

// Per-period growth rates: years_phase1 copies of growth_phase1 followed by a
// linear fade whose i-th step (1-based) is g1 + (g_terminal - g1) * i / m.
std::vector<double> growth_schedule(double growth_phase1,
                                    int years_phase1,
                                    int years_transition,
                                    double growth_terminal);

CashFlowProjection project_cash_flows(double base_flow,
                                      double growth_phase1,
                                      int years_phase1,
                                      int years_transition,
                                      double growth_terminal,
                                      double discount_rate);

// future_value / (1 + rate)^periods
double present_value(double future_value, double rate, int periods);

double free_cash_flow_to_firm(double ebit,
                              double tax_rate,
                              double capex,
                              double depreciation,
                              double delta_working_capital);

double free_cash_flow_to_equity(double net_income,
                                double depreciation,
                                double capex,
                                double delta_working_capital,
                                double net_debt_repayment = 0.0);

} // namespace valuation
