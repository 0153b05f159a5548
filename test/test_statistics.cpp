#include <catch2/catch.hpp>

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <valuation/statistics.hpp>

using Catch::Detail::Approx;

TEST_CASE("quantile_sorted interpolates between closest ranks") {
    const std::vector<double> data{1.0, 2.0, 3.0, 4.0, 5.0};

    REQUIRE(valuation::quantile_sorted(data, 0.25) == Approx(2.0));
    REQUIRE(valuation::quantile_sorted(data, 0.50) == Approx(3.0));
    REQUIRE(valuation::quantile_sorted(data, 0.90) == Approx(4.6));
}

TEST_CASE("quantile_sorted clamps extreme quantiles") {
    const std::vector<double> data{10.0, 20.0, 30.0};

    REQUIRE(valuation::quantile_sorted(data, -0.5) == Approx(10.0));
    REQUIRE(valuation::quantile_sorted(data, 1.5) == Approx(30.0));
    REQUIRE_THROWS_AS(valuation::quantile_sorted({}, 0.5), std::invalid_argument);
}

TEST_CASE("summarize_sorted reports population moments and tail probability") {
    const std::vector<double> data{-2.0, 0.0, 1.0, 3.0, 8.0};
    const auto stats = valuation::summarize_sorted(data);

    REQUIRE(stats.count == 5);
    REQUIRE(stats.mean == Approx(2.0));
    REQUIRE(stats.median == Approx(1.0));
    // Squared deviations: 16 + 4 + 1 + 1 + 36 = 58.
    REQUIRE(stats.stddev == Approx(std::sqrt(58.0 / 5.0)));
    REQUIRE(stats.min == -2.0);
    REQUIRE(stats.max == 8.0);
    REQUIRE(stats.probability_negative == Approx(0.2));
    REQUIRE(stats.p5 <= stats.p25);
    REQUIRE(stats.p75 <= stats.p95);
}

TEST_CASE("summarize_sorted is exact for identical values") {
    const std::vector<double> data(1000, 226.2287807735);
    const auto stats = valuation::summarize_sorted(data);

    REQUIRE(stats.mean == 226.2287807735);
    REQUIRE(stats.median == 226.2287807735);
    REQUIRE(stats.p5 == 226.2287807735);
    REQUIRE(stats.stddev == 0.0);
}

TEST_CASE("build_histogram bins the whole range") {
    const std::vector<double> data{0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 10.0};
    const auto histogram = valuation::build_histogram(data, 5);

    REQUIRE(histogram.bins() == 5);
    REQUIRE(histogram.edges.size() == 6);
    REQUIRE(histogram.edges.front() == 0.0);
    REQUIRE(histogram.edges.back() == 10.0);
    REQUIRE(histogram.counts == std::vector<std::size_t>{2, 2, 2, 2, 2});
    REQUIRE(std::accumulate(histogram.counts.begin(), histogram.counts.end(), std::size_t{0}) == data.size());
}

TEST_CASE("build_histogram puts a constant sample in the first bin") {
    const std::vector<double> data(10, 3.0);
    const auto histogram = valuation::build_histogram(data, 4);

    REQUIRE(histogram.counts[0] == 10);
    REQUIRE(histogram.counts[3] == 0);
    REQUIRE_THROWS_AS(valuation::build_histogram(data, 0), std::invalid_argument);
}

TEST_CASE("pearson_correlation detects linear relationships") {
    const std::vector<double> x{1.0, 2.0, 3.0, 4.0};
    const std::vector<double> y{2.0, 4.0, 6.0, 8.0};
    const std::vector<double> z{8.0, 6.0, 4.0, 2.0};

    REQUIRE(valuation::pearson_correlation(x, y) == Approx(1.0));
    REQUIRE(valuation::pearson_correlation(x, z) == Approx(-1.0));
    REQUIRE_THROWS_AS(valuation::pearson_correlation(x, {1.0, 1.0, 1.0, 1.0}), std::invalid_argument);
}
