/// @file src/advisors/statistics.cpp
/// @brief Mean, stddev, normal CDF/quantile and monthly bucketing.

#include "statistics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <numeric>

namespace finplan::stats {

double mean(std::span<const double> xs) noexcept {
    if (xs.empty()) return 0.0;
    return std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
}

std::optional<double> sample_stddev(std::span<const double> xs) noexcept {
    if (xs.size() < 2) return std::nullopt;
    const double m = mean(xs);
    double sq = 0.0;
    for (double x : xs) {
        const double d = x - m;
        sq += d * d;
    }
    return std::sqrt(sq / static_cast<double>(xs.size() - 1));
}

double normal_cdf(double x) noexcept {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double inverse_normal_cdf(double p) noexcept {
    // Coefficients from P. J. Acklam, "An algorithm for computing the inverse
    // normal cumulative distribution function".
    constexpr double a[] = {-3.969683028665376e+01,  2.209460984245205e+02,
                            -2.759285104469687e+02,  1.383577518672690e+02,
                            -3.066479806614716e+01,  2.506628277459239e+00};
    constexpr double b[] = {-5.447609879822406e+01,  1.615858368580409e+02,
                            -1.556989798598866e+02,  6.680131188771972e+01,
                            -1.328068155288572e+01};
    constexpr double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                            -2.400758277161838e+00, -2.549732539343734e+00,
                             4.374664141464968e+00,  2.938163982698783e+00};
    constexpr double d[] = { 7.784695709041462e-03,  3.224671290700398e-01,
                             2.445134137142996e+00,  3.754408661907416e+00};
    constexpr double P_LOW  = 0.02425;
    constexpr double P_HIGH = 1.0 - P_LOW;

    if (p <= 0.0) return -HUGE_VAL;
    if (p >= 1.0) return HUGE_VAL;

    if (p < P_LOW) {
        const double q = std::sqrt(-2.0 * std::log(p));
        return (((((c[0]*q + c[1])*q + c[2])*q + c[3])*q + c[4])*q + c[5]) /
               ((((d[0]*q + d[1])*q + d[2])*q + d[3])*q + 1.0);
    }
    if (p > P_HIGH) {
        const double q = std::sqrt(-2.0 * std::log(1.0 - p));
        return -(((((c[0]*q + c[1])*q + c[2])*q + c[3])*q + c[4])*q + c[5]) /
                ((((d[0]*q + d[1])*q + d[2])*q + d[3])*q + 1.0);
    }
    const double q = p - 0.5;
    const double r = q * q;
    return (((((a[0]*r + a[1])*r + a[2])*r + a[3])*r + a[4])*r + a[5]) * q /
           (((((b[0]*r + b[1])*r + b[2])*r + b[3])*r + b[4])*r + 1.0);
}

double round_to_cents(double x) noexcept {
    return std::round(x * 100.0) / 100.0;
}

double percentile_sorted(std::span<const double> sorted, double q) noexcept {
    if (sorted.empty()) return 0.0;
    q = std::clamp(q, 0.0, 1.0);
    const double pos = q * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(pos));
    const auto hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

std::vector<double>
monthly_totals(std::span<const TransactionRecord> records,
               std::optional<TransactionType> only) {
    using std::chrono::months;
    using std::chrono::year_month;

    std::map<year_month, double> buckets;
    for (const auto& r : records) {
        if (only && r.type() != *only) continue;
        buckets[year_month{r.date().year(), r.date().month()}] += r.amount();
    }
    if (buckets.empty()) return {};

    std::vector<double> out;
    const year_month last = buckets.rbegin()->first;
    for (year_month ym = buckets.begin()->first; ym <= last; ym += months{1}) {
        const auto it = buckets.find(ym);
        out.push_back(it == buckets.end() ? 0.0 : it->second);
    }
    return out;
}

}  // namespace finplan::stats
