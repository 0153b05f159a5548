#include <catch2/catch.hpp>

#include <vector>

#include <valuation/dcf.hpp>
#include <valuation/errors.hpp>
#include <valuation/sensitivity.hpp>

using Catch::Detail::Approx;

namespace {

valuation::ValuationParameters base_params() {
    valuation::ValuationParameters params;
    params.base_cash_flow = 66170.0;
    params.discount_rate = 0.0942;
    params.high_growth_rate = 0.12;
    params.high_growth_years = 5;
    params.transition_years = 5;
    params.terminal_growth_rate = 0.025;
    params.net_debt = -21000.0;
    params.share_count = 7430.0;
    return params;
}

} // namespace

TEST_CASE("sensitivity_grid keeps the caller's axis order") {
    const std::vector<double> rates{0.10, 0.08, 0.09};
    const std::vector<double> growth{0.03, 0.02};

    const auto grid = valuation::sensitivity_grid(base_params(),
                                                  valuation::Parameter::DiscountRate,
                                                  rates,
                                                  valuation::Parameter::TerminalGrowthRate,
                                                  growth);

    REQUIRE(grid.row_values == rates);
    REQUIRE(grid.column_values == growth);
    REQUIRE(grid.cells.size() == 3);
    REQUIRE(grid.cells[0].size() == 2);

    auto point = base_params();
    point.discount_rate = 0.08;
    point.terminal_growth_rate = 0.02;
    REQUIRE(*grid.at(1, 1).per_share_value == Approx(valuation::evaluate(point).per_share_value));
}

TEST_CASE("per-share value falls with the discount rate and rises with terminal growth") {
    const auto rates = valuation::centered_range(0.0942, 0.005, 7);
    const auto growth = valuation::centered_range(0.025, 0.005, 5);

    const auto grid = valuation::sensitivity_grid(base_params(),
                                                  valuation::Parameter::DiscountRate,
                                                  rates,
                                                  valuation::Parameter::TerminalGrowthRate,
                                                  growth);

    REQUIRE(grid.infeasible_count() == 0);
    for (std::size_t i = 0; i < rates.size(); ++i) {
        for (std::size_t j = 0; j < growth.size(); ++j) {
            if (i + 1 < rates.size()) {
                REQUIRE(*grid.at(i, j).per_share_value > *grid.at(i + 1, j).per_share_value);
            }
            if (j + 1 < growth.size()) {
                REQUIRE(*grid.at(i, j).per_share_value < *grid.at(i, j + 1).per_share_value);
            }
        }
    }

    REQUIRE(*grid.central_value() == Approx(valuation::evaluate(base_params()).per_share_value));
    REQUIRE(*grid.max_value() == *grid.at(0, growth.size() - 1).per_share_value);
    REQUIRE(*grid.min_value() == *grid.at(rates.size() - 1, 0).per_share_value);
}

TEST_CASE("infeasible cells are recorded without aborting the grid") {
    const std::vector<double> rates{0.03, 0.08};
    const std::vector<double> growth{0.02, 0.04};

    const auto grid = valuation::sensitivity_grid(base_params(),
                                                  valuation::Parameter::DiscountRate,
                                                  rates,
                                                  valuation::Parameter::TerminalGrowthRate,
                                                  growth);

    REQUIRE(grid.at(0, 0).feasible());
    REQUIRE_FALSE(grid.at(0, 1).feasible());
    REQUIRE_FALSE(grid.at(0, 1).error.empty());
    REQUIRE(grid.at(1, 0).feasible());
    REQUIRE(grid.at(1, 1).feasible());
    REQUIRE(grid.infeasible_count() == 1);
}

TEST_CASE("sensitivity_grid rejects degenerate axes") {
    const std::vector<double> values{0.08, 0.09};

    REQUIRE_THROWS_AS(valuation::sensitivity_grid(base_params(),
                                                  valuation::Parameter::DiscountRate,
                                                  values,
                                                  valuation::Parameter::DiscountRate,
                                                  values),
                      valuation::InvalidParameter);
    REQUIRE_THROWS_AS(valuation::sensitivity_grid(base_params(),
                                                  valuation::Parameter::DiscountRate,
                                                  {},
                                                  valuation::Parameter::TerminalGrowthRate,
                                                  values),
                      valuation::InvalidParameter);
}

TEST_CASE("an invalid field outside the axes fails the whole grid") {
    const std::vector<double> rates{0.08, 0.09};
    const std::vector<double> growth{0.02, 0.03};

    auto params = base_params();
    SECTION("share count") {
        params.share_count = 0.0;
    }
    SECTION("base cash flow") {
        params.base_cash_flow = -100.0;
    }
    SECTION("year count") {
        params.transition_years = valuation::kMaxYears + 1;
    }

    REQUIRE_THROWS_AS(valuation::sensitivity_grid(params,
                                                  valuation::Parameter::DiscountRate,
                                                  rates,
                                                  valuation::Parameter::TerminalGrowthRate,
                                                  growth),
                      valuation::InvalidParameter);
}

TEST_CASE("an invalid base value on a varied axis is replaced, not reported") {
    auto params = base_params();
    params.discount_rate = -0.05;
    params.terminal_growth_rate = 0.2;

    const auto grid = valuation::sensitivity_grid(params,
                                                  valuation::Parameter::DiscountRate,
                                                  {0.08, 0.09},
                                                  valuation::Parameter::TerminalGrowthRate,
                                                  {0.02, 0.03});
    REQUIRE(grid.infeasible_count() == 0);
}

TEST_CASE("exit multiple axes require the exit-multiple method") {
    const std::vector<double> multiples{8.0, 10.0};

    REQUIRE_THROWS_AS(valuation::sensitivity_grid(base_params(),
                                                  valuation::Parameter::ExitMultiple,
                                                  multiples,
                                                  valuation::Parameter::ExitMultiple,
                                                  multiples),
                      valuation::InvalidParameter);
    REQUIRE_THROWS_AS(valuation::sensitivity_grid(base_params(),
                                                  valuation::Parameter::ExitMultiple,
                                                  multiples,
                                                  valuation::Parameter::DiscountRate,
                                                  {0.08, 0.09}),
                      valuation::InvalidParameter);

    auto params = base_params();
    params.terminal_method = valuation::ExitMultiple{10.0, 200000.0};
    const auto grid = valuation::sensitivity_grid(params,
                                                  valuation::Parameter::ExitMultiple,
                                                  multiples,
                                                  valuation::Parameter::DiscountRate,
                                                  {0.08, 0.09});
    REQUIRE(grid.infeasible_count() == 0);
    REQUIRE(*grid.at(0, 0).per_share_value < *grid.at(1, 0).per_share_value);
}

TEST_CASE("centered_range spaces values evenly around the centre") {
    const auto odd = valuation::centered_range(0.09, 0.01, 5);
    REQUIRE(odd.size() == 5);
    REQUIRE(odd[0] == Approx(0.07));
    REQUIRE(odd[2] == Approx(0.09));
    REQUIRE(odd[4] == Approx(0.11));

    const auto even = valuation::centered_range(1.0, 1.0, 2);
    REQUIRE(even[0] == Approx(0.5));
    REQUIRE(even[1] == Approx(1.5));

    REQUIRE_THROWS_AS(valuation::centered_range(0.09, 0.0, 5), valuation::InvalidParameter);
    REQUIRE_THROWS_AS(valuation::centered_range(0.09, 0.01, 0), valuation::InvalidParameter);
}
