#include <valuation/distribution.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

#include <valuation/errors.hpp>

namespace valuation {

namespace {

void require_finite(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw InvalidParameter(field, value, "distribution parameters must be finite");
    }
}

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double triangular_quantile(const Triangular& dist, double u) noexcept {
    const double width = dist.max - dist.min;
    if (width <= 0.0) {
        return dist.mode;
    }
    u = std::clamp(u, 0.0, 1.0);
    const double split = (dist.mode - dist.min) / width;
    if (u < split) {
        return dist.min + std::sqrt(u * width * (dist.mode - dist.min));
    }
    return dist.max - std::sqrt((1.0 - u) * width * (dist.max - dist.mode));
}

double uniform_quantile(const Uniform& dist, double u) noexcept {
    if (dist.max <= dist.min) {
        return dist.min;
    }
    return dist.min + (dist.max - dist.min) * std::clamp(u, 0.0, 1.0);
}

double sample(const Normal& dist, double z) noexcept {
    if (dist.stddev == 0.0) {
        return dist.mean;
    }
    return dist.mean + dist.stddev * z;
}

double sample(const Triangular& dist, double z) noexcept {
    return triangular_quantile(dist, normal_cdf(z));
}

double sample(const Uniform& dist, double z) noexcept {
    return uniform_quantile(dist, normal_cdf(z));
}

double sample(const Lognormal& dist, double z) noexcept {
    if (dist.sigma == 0.0) {
        return std::exp(dist.mu);
    }
    return std::exp(dist.mu + dist.sigma * z);
}

double sample(const DistributionSpec& dist, double z) {
    return std::visit([z](const auto& d) { return sample(d, z); }, dist);
}

bool is_degenerate(const DistributionSpec& dist) {
    return std::visit(overloaded{
                          [](const Normal& d) { return d.stddev == 0.0; },
                          [](const Triangular& d) { return d.min == d.max; },
                          [](const Uniform& d) { return d.min == d.max; },
                          [](const Lognormal& d) { return d.sigma == 0.0; },
                      },
                      dist);
}

void validate(const DistributionSpec& dist, const std::string& field) {
    std::visit(overloaded{
                   [&](const Normal& d) {
                       require_finite(field, d.mean);
                       require_finite(field, d.stddev);
                       if (d.stddev < 0.0) {
                           throw InvalidParameter(field, d.stddev, "normal stddev must not be negative");
                       }
                   },
                   [&](const Triangular& d) {
                       require_finite(field, d.min);
                       require_finite(field, d.mode);
                       require_finite(field, d.max);
                       if (!(d.min <= d.mode && d.mode <= d.max)) {
                           throw InvalidParameter(field, d.mode, "triangular requires min <= mode <= max");
                       }
                   },
                   [&](const Uniform& d) {
                       require_finite(field, d.min);
                       require_finite(field, d.max);
                       if (d.min > d.max) {
                           throw InvalidParameter(field, d.min, "uniform requires min <= max");
                       }
                   },
                   [&](const Lognormal& d) {
                       require_finite(field, d.mu);
                       require_finite(field, d.sigma);
                       if (d.sigma < 0.0) {
                           throw InvalidParameter(field, d.sigma, "lognormal sigma must not be negative");
                       }
                   },
               },
               dist);
}

std::string describe(const DistributionSpec& dist) {
    return std::visit(overloaded{
                          [](const Normal& d) { return fmt::format("Normal(mean={}, stddev={})", d.mean, d.stddev); },
                          [](const Triangular& d) {
                              return fmt::format("Triangular(min={}, mode={}, max={})", d.min, d.mode, d.max);
                          },
                          [](const Uniform& d) { return fmt::format("Uniform(min={}, max={})", d.min, d.max); },
                          [](const Lognormal& d) { return fmt::format("Lognormal(mu={}, sigma={})", d.mu, d.sigma); },
                      },
                      dist);
}

} // namespace valuation
