#pragma once

#include <string>
#include <variant>

namespace valuation {

struct Normal {
    double mean = 0.0;
    double stddev = 0.0;
};

struct Triangular {
    double min = 0.0;
    double mode = 0.0;
    double max = 0.0;
};

struct Uniform {
    double min = 0.0;
    double max = 0.0;
};

struct Lognormal {
    double mu = 0.0;     // mean of log(X)
    double sigma = 0.0;  // stddev of log(X)
};

using DistributionSpec = std::variant<Normal, Triangular, Uniform, Lognormal>;

double normal_cdf(double x);

// Maps a standard-normal draw z onto the marginal. Zero-width specs return
// their single value exactly.
double sample(const Normal& dist, double z) noexcept;
double sample(const Triangular& dist, double z) noexcept;
double sample(const Uniform& dist, double z) noexcept;
double sample(const Lognormal& dist, double z) noexcept;
double sample(const DistributionSpec& dist, double z);

// Inverse-CDF transforms of a standard-uniform draw u in [0, 1].
double triangular_quantile(const Triangular& dist, double u) noexcept;
double uniform_quantile(const Uniform& dist, double u) noexcept;

bool is_degenerate(const DistributionSpec& dist);

// Throws InvalidParameter, using field to name the sampled parameter.
void validate(const DistributionSpec& dist, const std::string& field);

std::string describe(const DistributionSpec& dist);

} // namespace valuation
