#pragma once

/// @file src/advisors/statistics.hpp
/// @brief Small numeric helpers shared by the advisors (internal; not
///        installed).

#include "finplan/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace finplan::stats {

/// Arithmetic mean; 0 for an empty sample.
[[nodiscard]] double mean(std::span<const double> xs) noexcept;

/// Bessel-corrected standard deviation; `nullopt` for fewer than 2 values.
[[nodiscard]] std::optional<double> sample_stddev(std::span<const double> xs) noexcept;

/// Standard normal CDF Φ(x).
[[nodiscard]] double normal_cdf(double x) noexcept;

/// Standard normal quantile Φ⁻¹(p) for p in (0, 1) (Acklam's rational
/// approximation, relative error below 1.2e-9).
[[nodiscard]] double inverse_normal_cdf(double p) noexcept;

/// Round half away from zero to two decimals.
[[nodiscard]] double round_to_cents(double x) noexcept;

/// Linear-interpolated percentile of an ascending-sorted sample, q in [0, 1].
[[nodiscard]] double percentile_sorted(std::span<const double> sorted, double q) noexcept;

/// Amount per calendar month from the earliest to the latest record month,
/// months without records included as 0. Records of the other type are
/// ignored when `only` is set.
[[nodiscard]] std::vector<double>
monthly_totals(std::span<const TransactionRecord> records,
               std::optional<TransactionType> only = std::nullopt);

}  // namespace finplan::stats
