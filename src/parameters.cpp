#include <valuation/parameters.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <utility>

#include <valuation/errors.hpp>

namespace valuation {

namespace {

constexpr std::array<std::pair<Parameter, std::string_view>, 9> kParameterNames{{
    {Parameter::BaseCashFlow, "base_cash_flow"},
    {Parameter::DiscountRate, "discount_rate"},
    {Parameter::HighGrowthRate, "high_growth_rate"},
    {Parameter::HighGrowthYears, "high_growth_years"},
    {Parameter::TransitionYears, "transition_years"},
    {Parameter::TerminalGrowthRate, "terminal_growth_rate"},
    {Parameter::NetDebt, "net_debt"},
    {Parameter::ShareCount, "share_count"},
    {Parameter::ExitMultiple, "exit_multiple"},
}};

void require_finite(std::string_view field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidParameter(std::string(field), value, "must be finite");
    }
}

void require_positive(std::string_view field, double value) {
    require_finite(field, value);
    if (value <= 0.0) {
        throw InvalidParameter(std::string(field), value, "must be positive");
    }
}

void require_growth(std::string_view field, double value) {
    require_finite(field, value);
    if (value <= -1.0) {
        throw InvalidParameter(std::string(field), value, "growth rate must be greater than -100%");
    }
}

int to_years(Parameter parameter, double value) {
    if (!std::isfinite(value) || std::floor(value) != value) {
        throw InvalidParameter(std::string(to_string(parameter)), value, "year counts must be integral");
    }
    if (value < 0.0 || value > static_cast<double>(kMaxYears)) {
        throw InvalidParameter(std::string(to_string(parameter)), value, "year count out of range [0, 1000]");
    }
    return static_cast<int>(value);
}

void require_years(std::string_view field, int value) {
    if (value < 0 || value > kMaxYears) {
        throw InvalidParameter(std::string(field), value, "year count out of range [0, 1000]");
    }
}

} // namespace

bool ValuationParameters::uses_gordon_growth() const noexcept {
    return std::holds_alternative<GordonGrowth>(terminal_method);
}

void ValuationParameters::validate() const {
    validate_except({});
}

void ValuationParameters::validate_except(const std::vector<Parameter>& varied) const {
    auto checked = [&varied](Parameter parameter) {
        return std::find(varied.begin(), varied.end(), parameter) == varied.end();
    };

    if (checked(Parameter::BaseCashFlow)) {
        require_positive("base_cash_flow", base_cash_flow);
    }
    if (checked(Parameter::DiscountRate)) {
        require_positive("discount_rate", discount_rate);
    }
    if (checked(Parameter::HighGrowthRate)) {
        require_growth("high_growth_rate", high_growth_rate);
    }
    if (checked(Parameter::HighGrowthYears)) {
        require_years("high_growth_years", high_growth_years);
    }
    if (checked(Parameter::TransitionYears)) {
        require_years("transition_years", transition_years);
    }
    if (checked(Parameter::TerminalGrowthRate)) {
        require_growth("terminal_growth_rate", terminal_growth_rate);
    }
    if (checked(Parameter::NetDebt)) {
        require_finite("net_debt", net_debt);
    }
    if (checked(Parameter::ShareCount)) {
        require_positive("share_count", share_count);
    }

    if (const auto* gordon = std::get_if<GordonGrowth>(&terminal_method)) {
        if (checked(Parameter::TerminalGrowthRate) && checked(Parameter::DiscountRate) &&
            terminal_growth_rate >= discount_rate) {
            throw InvalidParameter("terminal_growth_rate",
                                   terminal_growth_rate,
                                   "must be below the discount rate for a Gordon terminal value");
        }
        if (gordon->stable_roic) {
            require_positive("stable_roic", *gordon->stable_roic);
        }
    } else {
        const auto& exit = std::get<ExitMultiple>(terminal_method);
        if (checked(Parameter::ExitMultiple)) {
            require_positive("exit_multiple", exit.multiple);
        }
        require_positive("terminal_metric", exit.terminal_metric);
    }
}

std::string_view to_string(Parameter parameter) noexcept {
    for (const auto& [candidate, name] : kParameterNames) {
        if (candidate == parameter) {
            return name;
        }
    }
    return "unknown";
}

std::optional<Parameter> parameter_from_name(std::string_view name) {
    for (const auto& [parameter, candidate] : kParameterNames) {
        if (candidate == name) {
            return parameter;
        }
    }
    return std::nullopt;
}

bool is_integral_parameter(Parameter parameter) noexcept {
    return parameter == Parameter::HighGrowthYears || parameter == Parameter::TransitionYears;
}

double parameter_value(const ValuationParameters& params, Parameter parameter) {
    switch (parameter) {
    case Parameter::BaseCashFlow:
        return params.base_cash_flow;
    case Parameter::DiscountRate:
        return params.discount_rate;
    case Parameter::HighGrowthRate:
        return params.high_growth_rate;
    case Parameter::HighGrowthYears:
        return static_cast<double>(params.high_growth_years);
    case Parameter::TransitionYears:
        return static_cast<double>(params.transition_years);
    case Parameter::TerminalGrowthRate:
        return params.terminal_growth_rate;
    case Parameter::NetDebt:
        return params.net_debt;
    case Parameter::ShareCount:
        return params.share_count;
    case Parameter::ExitMultiple:
        if (const auto* exit = std::get_if<ExitMultiple>(&params.terminal_method)) {
            return exit->multiple;
        }
        throw InvalidParameter("exit_multiple", 0.0, "parameters do not use the exit-multiple terminal method");
    }
    throw InvalidParameter("parameter", static_cast<double>(static_cast<int>(parameter)), "unknown parameter");
}

void set_parameter(ValuationParameters& params, Parameter parameter, double value) {
    switch (parameter) {
    case Parameter::BaseCashFlow:
        params.base_cash_flow = value;
        return;
    case Parameter::DiscountRate:
        params.discount_rate = value;
        return;
    case Parameter::HighGrowthRate:
        params.high_growth_rate = value;
        return;
    case Parameter::HighGrowthYears:
        params.high_growth_years = to_years(parameter, value);
        return;
    case Parameter::TransitionYears:
        params.transition_years = to_years(parameter, value);
        return;
    case Parameter::TerminalGrowthRate:
        params.terminal_growth_rate = value;
        return;
    case Parameter::NetDebt:
        params.net_debt = value;
        return;
    case Parameter::ShareCount:
        params.share_count = value;
        return;
    case Parameter::ExitMultiple:
        if (auto* exit = std::get_if<ExitMultiple>(&params.terminal_method)) {
            exit->multiple = value;
            return;
        }
        throw InvalidParameter("exit_multiple", value, "parameters do not use the exit-multiple terminal method");
    }
    throw InvalidParameter("parameter", static_cast<double>(static_cast<int>(parameter)), "unknown parameter");
}

ValuationParameters with_override(const ValuationParameters& params, Parameter parameter, double value) {
    ValuationParameters copy = params;
    set_parameter(copy, parameter, value);
    copy.validate();
    return copy;
}

ValuationParameters with_overrides(const ValuationParameters& params, const ParameterOverrides& overrides) {
    ValuationParameters copy = params;
    for (const auto& [parameter, value] : overrides) {
        set_parameter(copy, parameter, value);
    }
    copy.validate();
    return copy;
}

} // namespace valuation
