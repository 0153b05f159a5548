#include <valuation/dcf.hpp>

namespace valuation {

DcfBreakdown evaluate_detailed(const ValuationParameters& params) {
    params.validate();

    DcfBreakdown result;
    result.projection = project_cash_flows(params.base_cash_flow,
                                           params.high_growth_rate,
                                           params.high_growth_years,
                                           params.transition_years,
                                           params.terminal_growth_rate,
                                           params.discount_rate);

    result.terminal = compute_terminal_value(params.terminal_method,
                                             result.projection.last_flow(params.base_cash_flow),
                                             params.terminal_growth_rate,
                                             params.discount_rate,
                                             params.horizon_years());

    ValuationOutcome& out = result.outcome;
    out.explicit_pv = result.projection.total_present_value();
    out.terminal_pv = result.terminal.present_value;
    out.enterprise_value = out.explicit_pv + out.terminal_pv;
    out.terminal_ratio = out.enterprise_value != 0.0 ? out.terminal_pv / out.enterprise_value : 0.0;
    result.terminal.ratio_of_enterprise_value = out.terminal_ratio;

    out.equity_value = params.basis == CashFlowBasis::Firm ? out.enterprise_value - params.net_debt
                                                           : out.enterprise_value;
    out.per_share_value = out.equity_value / params.share_count;
    return result;
}

ValuationOutcome evaluate(const ValuationParameters& params) {
    return evaluate_detailed(params).outcome;
}

} // namespace valuation
