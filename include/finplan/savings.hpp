#pragma once

/// @file include/finplan/savings.hpp
/// @brief SavingsOptimizer — goal feasibility by Monte-Carlo simulation.
///
/// # Module: Savings Optimizer
///
/// ## Model
///     required    = max(0, goal − current) / months
///     recommended = min(required, affordable_fraction · income)
///
/// Each trial draws a monthly return r ~ N(annual_return/12,
/// annual_volatility/√12) for every month and evolves
///
///     balance ← balance · (1 + r) + recommended
///
/// from `current`. The success probability is the share of trials that end
/// at or above the goal. A goal that is already met short-circuits to a
/// recommendation of 0 and probability 1 without simulating.
///
/// ## Guarantees
/// - Deterministic when `SavingsConfig::seed` is set
/// - Each call owns its generator; concurrent calls are independent

#include "finplan/constants.hpp"
#include "finplan/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace finplan::advisors {

struct SavingsConfig {
    double      annual_return        = constants::DEFAULT_ANNUAL_RETURN;
    double      annual_volatility    = constants::DEFAULT_ANNUAL_VOLATILITY;
    std::size_t trials               = constants::MONTE_CARLO_TRIALS;
    double      affordable_fraction  = constants::AFFORDABLE_INCOME_FRACTION;
    double      reconsider_threshold = constants::RECONSIDER_THRESHOLD;
    std::size_t max_timeframe_months = constants::MAX_SAVINGS_MONTHS;
    std::optional<std::uint64_t> seed;
};

struct SavingsPlan {
    double required_monthly    = 0.0;
    double recommended_monthly = 0.0;
    double success_probability = 0.0;  ///< In [0, 1], two decimals
    bool   reconsider_plan     = false;

    /// Ending-balance percentiles across trials.
    double p10_balance = 0.0;
    double p50_balance = 0.0;
    double p90_balance = 0.0;

    [[nodiscard]] std::string to_string() const;
};

class SavingsOptimizer {
public:
    explicit SavingsOptimizer(SavingsConfig config = SavingsConfig{}) : config_(config) {}

    /// # Errors
    /// Negative or non-finite savings, goal or income; a timeframe of 0 or
    /// above `max_timeframe_months`.
    [[nodiscard]] Result<SavingsPlan>
    calculate_plan(double current_savings, double goal_amount,
                   std::size_t timeframe_months, double monthly_income) const;

private:
    SavingsConfig config_;
};

}  // namespace finplan::advisors
