/// @file src/stats/statistics.cpp
/// @brief Eigen-backed statistics kernels.

#include "tkg/statistics.hpp"
#include "tkg/constants.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace tkg::stats {

namespace {

using ConstVec = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] ConstVec as_vector(std::span<const double> v) noexcept {
    return ConstVec(v.data(), static_cast<Eigen::Index>(v.size()));
}

[[nodiscard]] bool all_finite(std::span<const double> v) noexcept {
    return std::all_of(v.begin(), v.end(), [](double x) { return std::isfinite(x); });
}

/// Pearson over two equal-length Eigen maps; caller checked size and finiteness.
/// Expression templates only, nothing is allocated.
[[nodiscard]] std::optional<double> pearson_unchecked(const ConstVec& x,
                                                      const ConstVec& y) noexcept {
    const double mx  = x.mean();
    const double my  = y.mean();
    const double sxx = (x.array() - mx).square().sum();
    const double syy = (y.array() - my).square().sum();
    // Variance floor relative to magnitude, so rescaling a series never
    // changes whether its correlation is defined.
    if (sxx <= constants::FLOAT_EPSILON * x.squaredNorm() ||
        syy <= constants::FLOAT_EPSILON * y.squaredNorm()) {
        return std::nullopt;
    }
    const double sxy = ((x.array() - mx) * (y.array() - my)).sum();
    const double r = sxy / std::sqrt(sxx * syy);
    if (!std::isfinite(r)) {
        return std::nullopt;
    }
    return std::clamp(r, -1.0, 1.0);
}

}  // namespace

// ─── Moments ──────────────────────────────────────────────────────────────────

std::optional<double> mean(std::span<const double> v) noexcept {
    if (v.empty() || !all_finite(v)) return std::nullopt;
    return as_vector(v).mean();
}

std::optional<double> population_stddev(std::span<const double> v) noexcept {
    if (v.empty() || !all_finite(v)) return std::nullopt;
    const ConstVec x = as_vector(v);
    return std::sqrt((x.array() - x.mean()).square().mean());
}

// ─── Correlation ──────────────────────────────────────────────────────────────

std::optional<double>
pearson(std::span<const double> x, std::span<const double> y) noexcept {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;
    if (!all_finite(x) || !all_finite(y))     return std::nullopt;
    return pearson_unchecked(as_vector(x), as_vector(y));
}

double lagged_correlation_p_value(std::span<const double> cause,
                                  std::span<const double> effect) noexcept {
    const std::size_t n = std::min(cause.size(), effect.size());
    if (n < 3) {
        // Fewer than two aligned (cause[t], effect[t+1]) pairs.
        return 1.0;
    }

    const auto lagged  = cause.subspan(0, n - 1);
    const auto current = effect.subspan(1, n - 1);

    const auto r = pearson(lagged, current);
    if (!r) {
        return 1.0;
    }
    return std::clamp(1.0 - std::abs(*r), 0.0, 1.0);
}

LagCorrelation
cross_correlation(std::span<const double> a, std::span<const double> b) noexcept {
    if (a.size() < 2 || b.size() < 2 || !all_finite(a) || !all_finite(b)) {
        return {};
    }

    // Pearson is invariant under z-scoring, so the raw series are sliced
    // directly.
    const int max_lag = static_cast<int>(std::min(a.size(), b.size()) / 2);

    LagCorrelation best;
    bool found = false;

    for (int lag = -max_lag; lag <= max_lag; ++lag) {
        std::span<const double> x;
        std::span<const double> y;
        if (lag >= 0) {
            const auto k = static_cast<std::size_t>(lag);
            x = a;
            y = b.subspan(k);
        } else {
            const auto k = static_cast<std::size_t>(-lag);
            x = a.subspan(k);
            y = b;
        }
        // Overlapping prefix of both slices.
        const std::size_t len = std::min(x.size(), y.size());
        if (len < 2) continue;

        const auto r = pearson(x.first(len), y.first(len));
        if (!r) continue;

        if (!found || std::abs(*r) > std::abs(best.correlation)) {
            best  = LagCorrelation{*r, lag};
            found = true;
        }
    }

    return found ? best : LagCorrelation{};
}

}  // namespace tkg::stats
