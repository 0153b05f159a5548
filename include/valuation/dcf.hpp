#pragma once

#include <valuation/cash_flows.hpp>
#include <valuation/parameters.hpp>
#include <valuation/terminal_value.hpp>

namespace valuation {

struct ValuationOutcome {
    double enterprise_value = 0.0;  // discounted total; equity value for an FCFE basis
    double equity_value = 0.0;
    double per_share_value = 0.0;
    double explicit_pv = 0.0;
    double terminal_pv = 0.0;
    double terminal_ratio = 0.0;
};

struct DcfBreakdown {
    CashFlowProjection projection;
    TerminalValue terminal;
    ValuationOutcome outcome;
};

// Pure and re-entrant. Throws InvalidParameter for invalid inputs.
ValuationOutcome evaluate(const ValuationParameters& params);

// Same computation, keeping the projection and terminal value for display.
DcfBreakdown evaluate_detailed(const ValuationParameters& params);

} // namespace valuation
