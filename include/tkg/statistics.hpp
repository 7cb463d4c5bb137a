#pragma once

/// @file include/tkg/statistics.hpp
/// @brief Numeric kernels for causal screening and periodicity analysis.
///
/// # Module: Statistics
///
/// ## Responsibility
/// Means, deviations and correlations over `std::span<const double>`, backed
/// by Eigen maps and expression templates (no copies, no temporaries).
///
/// ## Causality screen
/// `lagged_correlation_p_value` is a one-lag correlation proxy for Granger
/// causality, NOT a VAR-based Granger test: it correlates cause[t] with
/// effect[t+1] and reports `1 − |corr|` as a pseudo-p-value. Downstream
/// thresholds (p < 0.1, |corr| > 0.3) are tuned to this proxy; upgrading it
/// to a real Granger test requires re-validating them.
///
/// ## Guarantees
/// - Never throws and never allocates; degenerate inputs (too short, zero
///   variance, non-finite) return `nullopt` or the documented neutral value
/// - Results are invariant under positive rescaling of a series

#include <optional>
#include <span>

namespace tkg::stats {

/// Best lag found by `cross_correlation`.
struct LagCorrelation {
    double correlation = 0.0;  ///< Signed Pearson correlation at `lag`
    int    lag         = 0;    ///< Positive: effect trails cause by `lag` steps
};

/// Arithmetic mean. `nullopt` for an empty or non-finite series.
[[nodiscard]] std::optional<double> mean(std::span<const double> v) noexcept;

/// Population standard deviation (n denominator).
/// `nullopt` for an empty or non-finite series.
[[nodiscard]] std::optional<double> population_stddev(std::span<const double> v) noexcept;

/// Pearson correlation of two equal-length series.
///
/// # Returns
/// `nullopt` if lengths differ, fewer than 2 points, any value is non-finite
/// or either series has zero variance.
[[nodiscard]] std::optional<double>
pearson(std::span<const double> x, std::span<const double> y) noexcept;

/// One-lag causality screen: correlate `cause[0..n-2]` with `effect[1..n-1]`
/// where `n = min(|cause|, |effect|)`.
///
/// # Returns
/// Pseudo-p-value `1 − |corr|` clamped to [0, 1]; 1.0 when fewer than two
/// aligned pairs exist or the correlation is undefined.
[[nodiscard]] double
lagged_correlation_p_value(std::span<const double> cause,
                           std::span<const double> effect) noexcept;

/// Cross-correlation sweep over lags `[−L, L]`, `L = min(|a|, |b|) / 2`.
/// Pearson is unchanged by z-scoring, so slices of the input series are
/// correlated in place.
///
/// For lag k > 0 correlates a[0..] with b[k..]; for k < 0 a[-k..] with b[0..].
/// Lags whose correlation is undefined are skipped.
///
/// # Returns
/// The lag with the largest |correlation| (earliest lag on ties), or
/// `{0.0, 0}` if either series has fewer than 2 points or no lag is defined.
[[nodiscard]] LagCorrelation
cross_correlation(std::span<const double> a, std::span<const double> b) noexcept;

}  // namespace tkg::stats
