#include <catch2/catch.hpp>

#include <vector>

#include <Eigen/Dense>

#include <valuation/correlation.hpp>
#include <valuation/errors.hpp>

using Catch::Detail::Approx;

using valuation::Parameter;

TEST_CASE("cholesky factor reproduces the correlation matrix") {
    const valuation::CorrelationMatrix corr(
        {Parameter::DiscountRate, Parameter::HighGrowthRate, Parameter::TerminalGrowthRate},
        std::vector<valuation::Correlation>{
            {Parameter::DiscountRate, Parameter::HighGrowthRate, -0.4},
            {Parameter::HighGrowthRate, Parameter::TerminalGrowthRate, 0.3},
        });

    const Eigen::MatrixXd& L = corr.cholesky_factor();
    const Eigen::MatrixXd rebuilt = L * L.transpose();
    for (Eigen::Index i = 0; i < 3; ++i) {
        for (Eigen::Index j = 0; j < 3; ++j) {
            REQUIRE(rebuilt(i, j) == Approx(corr.matrix()(i, j)).margin(1e-12));
            if (j > i) {
                REQUIRE(L(i, j) == 0.0);
            }
        }
    }
    REQUIRE(corr.rho(Parameter::HighGrowthRate, Parameter::DiscountRate) == Approx(-0.4));
    REQUIRE(corr.rho(Parameter::DiscountRate, Parameter::TerminalGrowthRate) == 0.0);
}

TEST_CASE("perfect correlation is accepted") {
    const valuation::CorrelationMatrix corr(
        {Parameter::DiscountRate, Parameter::HighGrowthRate},
        std::vector<valuation::Correlation>{{Parameter::DiscountRate, Parameter::HighGrowthRate, 1.0}});

    const Eigen::MatrixXd& L = corr.cholesky_factor();
    REQUIRE(L(0, 0) == Approx(1.0));
    REQUIRE(L(1, 0) == Approx(1.0));
    REQUIRE(L(1, 1) == Approx(0.0).margin(1e-12));
}

TEST_CASE("non positive semi-definite matrices are rejected") {
    // Pairwise valid, jointly impossible.
    REQUIRE_THROWS_AS(valuation::CorrelationMatrix(
                          {Parameter::DiscountRate, Parameter::HighGrowthRate, Parameter::TerminalGrowthRate},
                          std::vector<valuation::Correlation>{
                              {Parameter::DiscountRate, Parameter::HighGrowthRate, 0.9},
                              {Parameter::HighGrowthRate, Parameter::TerminalGrowthRate, 0.9},
                              {Parameter::DiscountRate, Parameter::TerminalGrowthRate, -0.9},
                          }),
                      valuation::SingularCorrelationMatrix);
}

TEST_CASE("malformed matrices are rejected as invalid parameters") {
    Eigen::MatrixXd asymmetric(2, 2);
    asymmetric << 1.0, 0.3, 0.2, 1.0;
    REQUIRE_THROWS_AS(valuation::CorrelationMatrix({Parameter::DiscountRate, Parameter::HighGrowthRate}, asymmetric),
                      valuation::InvalidParameter);

    Eigen::MatrixXd out_of_range(2, 2);
    out_of_range << 1.0, 1.5, 1.5, 1.0;
    REQUIRE_THROWS_AS(
        valuation::CorrelationMatrix({Parameter::DiscountRate, Parameter::HighGrowthRate}, out_of_range),
        valuation::InvalidParameter);

    REQUIRE_THROWS_AS(valuation::CorrelationMatrix(
                          {Parameter::DiscountRate},
                          std::vector<valuation::Correlation>{
                              {Parameter::DiscountRate, Parameter::NetDebt, 0.5}}),
                      valuation::InvalidParameter);
}

TEST_CASE("reordered fills uncorrelated parameters with identity entries") {
    const valuation::CorrelationMatrix corr(
        {Parameter::DiscountRate, Parameter::HighGrowthRate},
        std::vector<valuation::Correlation>{{Parameter::DiscountRate, Parameter::HighGrowthRate, 0.5}});

    const auto full = corr.reordered({Parameter::HighGrowthRate, Parameter::TerminalGrowthRate, Parameter::DiscountRate});
    REQUIRE(full.size() == 3);
    REQUIRE(full.rho(Parameter::HighGrowthRate, Parameter::DiscountRate) == 0.5);
    REQUIRE(full.rho(Parameter::TerminalGrowthRate, Parameter::DiscountRate) == 0.0);
    REQUIRE(full.matrix()(1, 1) == 1.0);

    REQUIRE_THROWS_AS(corr.reordered({Parameter::HighGrowthRate}), valuation::InvalidParameter);
}
