/// @file tests/advisors/test_savings_optimizer.cpp
/// @brief Tests for SavingsOptimizer (Monte-Carlo goal feasibility).

#include "finplan/savings.hpp"

#include <gtest/gtest.h>

using namespace finplan::advisors;

// ─── Helpers ──────────────────────────────────────────────────────────────────

static SavingsOptimizer seeded(SavingsConfig cfg = {}) {
    cfg.seed = 42;
    return SavingsOptimizer(cfg);
}

// ─── Plans ────────────────────────────────────────────────────────────────────

TEST(SavingsOptimizer, RequiredAndRecommendedContributions) {
    const auto plan = seeded().calculate_plan(0.0, 10000.0, 10, 10000.0);
    ASSERT_TRUE(plan.has_value()) << plan.error();
    EXPECT_DOUBLE_EQ(plan->required_monthly, 1000.0);
    EXPECT_DOUBLE_EQ(plan->recommended_monthly, 1000.0);
}

TEST(SavingsOptimizer, RecommendationCappedByIncome) {
    const auto plan = seeded().calculate_plan(0.0, 10000.0, 10, 1000.0);
    ASSERT_TRUE(plan.has_value());
    EXPECT_DOUBLE_EQ(plan->required_monthly, 1000.0);
    EXPECT_DOUBLE_EQ(plan->recommended_monthly, 300.0);
    EXPECT_DOUBLE_EQ(plan->success_probability, 0.0);
    EXPECT_TRUE(plan->reconsider_plan);
}

TEST(SavingsOptimizer, NearlyRisklessGrowthSucceeds) {
    SavingsConfig cfg;
    cfg.annual_return     = 0.12;
    cfg.annual_volatility = 1e-6;
    const auto plan = seeded(cfg).calculate_plan(0.0, 9000.0, 10, 100000.0);
    ASSERT_TRUE(plan.has_value());
    EXPECT_DOUBLE_EQ(plan->success_probability, 1.0);
    EXPECT_FALSE(plan->reconsider_plan);
    EXPECT_GT(plan->p10_balance, 9000.0);
}

TEST(SavingsOptimizer, GoalAlreadyMet) {
    const auto plan = seeded().calculate_plan(5000.0, 1000.0, 12, 2000.0);
    ASSERT_TRUE(plan.has_value());
    EXPECT_DOUBLE_EQ(plan->required_monthly, 0.0);
    EXPECT_DOUBLE_EQ(plan->recommended_monthly, 0.0);
    EXPECT_DOUBLE_EQ(plan->success_probability, 1.0);
    EXPECT_FALSE(plan->reconsider_plan);
    EXPECT_DOUBLE_EQ(plan->p50_balance, 5000.0);
}

TEST(SavingsOptimizer, PercentilesOrdered) {
    const auto plan = seeded().calculate_plan(1000.0, 50000.0, 60, 3000.0);
    ASSERT_TRUE(plan.has_value());
    EXPECT_LE(plan->p10_balance, plan->p50_balance);
    EXPECT_LE(plan->p50_balance, plan->p90_balance);
    EXPECT_GE(plan->success_probability, 0.0);
    EXPECT_LE(plan->success_probability, 1.0);
}

TEST(SavingsOptimizer, SeedMakesRunsReproducible) {
    const auto a = seeded().calculate_plan(1000.0, 20000.0, 24, 2500.0);
    const auto b = seeded().calculate_plan(1000.0, 20000.0, 24, 2500.0);
    ASSERT_TRUE(a.has_value() && b.has_value());
    EXPECT_DOUBLE_EQ(a->success_probability, b->success_probability);
    EXPECT_DOUBLE_EQ(a->p50_balance, b->p50_balance);
}

// ─── Errors ───────────────────────────────────────────────────────────────────

TEST(SavingsOptimizerErrors, NegativeInputs) {
    const auto r = seeded().calculate_plan(-1.0, 1000.0, 12, 100.0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "Savings, goal, and income must be non-negative");
    EXPECT_FALSE(seeded().calculate_plan(0.0, -1.0, 12, 100.0).has_value());
    EXPECT_FALSE(seeded().calculate_plan(0.0, 1000.0, 12, -100.0).has_value());
}

TEST(SavingsOptimizerErrors, TimeframeBounds) {
    EXPECT_EQ(seeded().calculate_plan(0.0, 1000.0, 0, 100.0).error(),
              "Timeframe must be positive");
    EXPECT_FALSE(seeded().calculate_plan(0.0, 1000.0, 1201, 100.0).has_value());
    EXPECT_TRUE(seeded().calculate_plan(0.0, 1000.0, 1200, 100.0).has_value());
}

TEST(SavingsOptimizerErrors, ZeroTrials) {
    SavingsConfig cfg;
    cfg.trials = 0;
    EXPECT_FALSE(seeded(cfg).calculate_plan(0.0, 1000.0, 12, 100.0).has_value());
}
