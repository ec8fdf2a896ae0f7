/// @file tests/advisors/test_statistics.cpp
/// @brief Tests for the numeric helpers behind the advisors.

#include "advisors/statistics.hpp"
#include "finplan/taxonomy.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <vector>

using namespace finplan;

namespace {

TransactionRecord record(Date date, double amount, TransactionType type) {
    TransactionFields f;
    f.date        = date;
    f.description = "entry";
    f.amount      = amount;
    f.type        = type;
    f.category    = type == TransactionType::Expense ? Category{"Food", "groceries"}
                                                     : Category{"Employment", "salary"};
    return std::move(TransactionRecord::make(f, *CategoryTaxonomy::standard())).value();
}

}  // namespace

// ─── Moments ──────────────────────────────────────────────────────────────────

TEST(StatsMoments, MeanAndSampleStddev) {
    const std::vector<double> xs = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    EXPECT_DOUBLE_EQ(stats::mean(xs), 5.0);
    // Sum of squared deviations = 32, n − 1 = 7.
    EXPECT_NEAR(*stats::sample_stddev(xs), std::sqrt(32.0 / 7.0), 1e-12);
}

TEST(StatsMoments, DegenerateSamples) {
    EXPECT_DOUBLE_EQ(stats::mean(std::vector<double>{}), 0.0);
    EXPECT_FALSE(stats::sample_stddev(std::vector<double>{3.0}).has_value());
    EXPECT_DOUBLE_EQ(*stats::sample_stddev(std::vector<double>{3.0, 3.0}), 0.0);
}

// ─── Normal distribution ──────────────────────────────────────────────────────

TEST(StatsNormal, CdfKnownPoints) {
    EXPECT_NEAR(stats::normal_cdf(0.0), 0.5, 1e-12);
    EXPECT_NEAR(stats::normal_cdf(1.959963984540054), 0.975, 1e-9);
    EXPECT_NEAR(stats::normal_cdf(-1.0), 0.158655253931457, 1e-9);
}

TEST(StatsNormal, QuantileInvertsCdf) {
    for (double p : {0.001, 0.01, 0.05, 0.3, 0.5, 0.8, 0.975, 0.999}) {
        EXPECT_NEAR(stats::normal_cdf(stats::inverse_normal_cdf(p)), p, 1e-8) << p;
    }
    EXPECT_NEAR(stats::inverse_normal_cdf(0.975), 1.959963984540054, 1e-7);
    EXPECT_TRUE(std::isinf(stats::inverse_normal_cdf(0.0)));
}

// ─── Rounding and percentiles ─────────────────────────────────────────────────

TEST(StatsRounding, Cents) {
    EXPECT_DOUBLE_EQ(stats::round_to_cents(1.005001), 1.01);
    EXPECT_DOUBLE_EQ(stats::round_to_cents(-2.499), -2.5);
    EXPECT_DOUBLE_EQ(stats::round_to_cents(3.0), 3.0);
}

TEST(StatsPercentile, LinearInterpolation) {
    const std::vector<double> xs = {10.0, 20.0, 30.0, 40.0, 50.0};
    EXPECT_DOUBLE_EQ(stats::percentile_sorted(xs, 0.0), 10.0);
    EXPECT_DOUBLE_EQ(stats::percentile_sorted(xs, 0.5), 30.0);
    EXPECT_DOUBLE_EQ(stats::percentile_sorted(xs, 0.1), 14.0);
    EXPECT_DOUBLE_EQ(stats::percentile_sorted(xs, 1.0), 50.0);
    EXPECT_DOUBLE_EQ(stats::percentile_sorted(std::vector<double>{7.0}, 0.9), 7.0);
}

// ─── Monthly totals ───────────────────────────────────────────────────────────

TEST(StatsMonthlyTotals, FillsGapsWithZero) {
    const std::vector<TransactionRecord> recs = {
        record(*make_date(2023, 12, 5), 100.0, TransactionType::Expense),
        record(*make_date(2024, 2, 1), 50.0, TransactionType::Expense),
        record(*make_date(2024, 2, 20), 25.0, TransactionType::Expense),
    };
    const auto totals = stats::monthly_totals(recs);
    ASSERT_EQ(totals.size(), 3u);
    EXPECT_DOUBLE_EQ(totals[0], 100.0);
    EXPECT_DOUBLE_EQ(totals[1], 0.0);
    EXPECT_DOUBLE_EQ(totals[2], 75.0);
}

TEST(StatsMonthlyTotals, TypeFilter) {
    const std::vector<TransactionRecord> recs = {
        record(*make_date(2024, 1, 5), 100.0, TransactionType::Expense),
        record(*make_date(2024, 3, 1), 9000.0, TransactionType::Income),
    };
    EXPECT_EQ(stats::monthly_totals(recs).size(), 3u);
    const auto expenses = stats::monthly_totals(recs, TransactionType::Expense);
    ASSERT_EQ(expenses.size(), 1u);
    EXPECT_DOUBLE_EQ(expenses[0], 100.0);
    EXPECT_TRUE(stats::monthly_totals({}).empty());
}
