#include <catch2/catch.hpp>

#include <cmath>

#include <valuation/errors.hpp>
#include <valuation/terminal_value.hpp>

using Catch::Detail::Approx;

TEST_CASE("gordon_growth_value matches the closed form across rate pairs") {
    const double last_flow = 1000.0;
    const double pairs[][2] = {{0.0, 0.08}, {0.02, 0.08}, {0.025, 0.0942}, {0.04, 0.05}, {-0.01, 0.06}};

    for (const auto& pair : pairs) {
        const double g = pair[0];
        const double r = pair[1];
        REQUIRE(valuation::gordon_growth_value(last_flow, g, r) == Approx(last_flow * (1.0 + g) / (r - g)));
    }
}

TEST_CASE("gordon_growth_value requires growth below the discount rate") {
    REQUIRE_THROWS_AS(valuation::gordon_growth_value(1000.0, 0.08, 0.08), valuation::InvalidParameter);
    REQUIRE_THROWS_AS(valuation::gordon_growth_value(1000.0, 0.09, 0.08), valuation::InvalidParameter);

    try {
        valuation::gordon_growth_value(1000.0, 0.09, 0.08);
    } catch (const valuation::InvalidParameter& ex) {
        REQUIRE(ex.field() == "terminal_growth_rate");
        REQUIRE(ex.value() == 0.09);
    }
}

TEST_CASE("gordon_growth_value with a stable ROIC nets out reinvestment") {
    const double plain = valuation::gordon_growth_value(1000.0, 0.03, 0.09);
    const double adjusted = valuation::gordon_growth_value(1000.0, 0.03, 0.09, 0.12);

    REQUIRE(adjusted == Approx(plain * (1.0 - 0.03 / 0.12)));
    REQUIRE_THROWS_AS(valuation::gordon_growth_value(1000.0, 0.03, 0.09, 0.0), valuation::InvalidParameter);
}

TEST_CASE("exit_multiple_value multiplies the terminal metric") {
    REQUIRE(valuation::exit_multiple_value(500.0, 12.0) == Approx(6000.0));
    REQUIRE_THROWS_AS(valuation::exit_multiple_value(-500.0, 12.0), valuation::InvalidParameter);
    REQUIRE_THROWS_AS(valuation::exit_multiple_value(500.0, 0.0), valuation::InvalidParameter);
}

TEST_CASE("compute_terminal_value discounts over the explicit horizon") {
    const auto gordon = valuation::compute_terminal_value(valuation::GordonGrowth{}, 1000.0, 0.02, 0.08, 10);
    REQUIRE(gordon.nominal == Approx(1000.0 * 1.02 / 0.06));
    REQUIRE(gordon.present_value == Approx(gordon.nominal / std::pow(1.08, 10)));

    const auto exit = valuation::compute_terminal_value(valuation::ExitMultiple{10.0, 400.0}, 1000.0, 0.02, 0.08, 5);
    REQUIRE(exit.nominal == Approx(4000.0));
    REQUIRE(exit.present_value == Approx(4000.0 / std::pow(1.08, 5)));

    const auto immediate = valuation::compute_terminal_value(valuation::GordonGrowth{}, 1000.0, 0.02, 0.08, 0);
    REQUIRE(immediate.present_value == Approx(immediate.nominal));
}

TEST_CASE("exit multiple terminal values ignore the growth/discount ordering") {
    const auto tv = valuation::compute_terminal_value(valuation::ExitMultiple{8.0, 100.0}, 1000.0, 0.12, 0.08, 3);
    REQUIRE(tv.nominal == Approx(800.0));
}
