#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace valuation {

inline constexpr int kMaxYears = 1000;

enum class CashFlowBasis : std::uint8_t { Firm = 0, Equity = 1 };

struct GordonGrowth {
    // When set, the terminal flow is reduced by the reinvestment g / ROIC.
    std::optional<double> stable_roic;
};

struct ExitMultiple {
    double multiple = 0.0;
    double terminal_metric = 0.0;  // e.g. EBITDA of the last explicit year
};

using TerminalMethod = std::variant<GordonGrowth, ExitMultiple>;

enum class Parameter : std::uint8_t {
    BaseCashFlow,
    DiscountRate,
    HighGrowthRate,
    HighGrowthYears,
    TransitionYears,
    TerminalGrowthRate,
    NetDebt,
    ShareCount,
    ExitMultiple,
};

struct ValuationParameters {
    double base_cash_flow = 0.0;
    double discount_rate = 0.0;
    double high_growth_rate = 0.0;
    int high_growth_years = 0;
    int transition_years = 0;
    double terminal_growth_rate = 0.0;
    double net_debt = 0.0;      // negative for a net cash position
    double share_count = 0.0;
    CashFlowBasis basis = CashFlowBasis::Firm;
    TerminalMethod terminal_method = GordonGrowth{};

    int horizon_years() const noexcept { return high_growth_years + transition_years; }
    bool uses_gordon_growth() const noexcept;

    // Throws InvalidParameter naming the first offending field.
    void validate() const;
    // Same checks, skipping the listed fields and any cross-field check that
    // involves one of them.
    void validate_except(const std::vector<Parameter>& varied) const;
};

using ParameterOverrides = std::map<Parameter, double>;

std::string_view to_string(Parameter parameter) noexcept;

std::optional<Parameter> parameter_from_name(std::string_view name);

bool is_integral_parameter(Parameter parameter) noexcept;

double parameter_value(const ValuationParameters& params, Parameter parameter);

// Assigns a single field. Only field-level checks run here (integral years,
// exit multiple requires the exit-multiple method); call validate() afterwards.
void set_parameter(ValuationParameters& params, Parameter parameter, double value);

// Returns a validated copy of params with the fields replaced.
ValuationParameters with_override(const ValuationParameters& params, Parameter parameter, double value);

ValuationParameters with_overrides(const ValuationParameters& params, const ParameterOverrides& overrides);

} // namespace valuation
