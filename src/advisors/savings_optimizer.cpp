/// @file src/advisors/savings_optimizer.cpp
/// @brief Monte-Carlo savings-goal simulation on Eigen arrays.

#include "finplan/logging.hpp"
#include "finplan/savings.hpp"

#include "statistics.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

namespace finplan::advisors {

std::string SavingsPlan::to_string() const {
    return fmt::format("required={:.2f} recommended={:.2f} success={:.2f} reconsider={} "
                       "p10={:.2f} p50={:.2f} p90={:.2f}",
                       required_monthly, recommended_monthly, success_probability,
                       reconsider_plan, p10_balance, p50_balance, p90_balance);
}

Result<SavingsPlan> SavingsOptimizer::calculate_plan(double current_savings,
                                                     double goal_amount,
                                                     std::size_t timeframe_months,
                                                     double monthly_income) const {
    auto& log = *logging::logger();

    for (double x : {current_savings, goal_amount, monthly_income}) {
        if (!std::isfinite(x) || x < 0.0) {
            log.warn("Rejected savings inputs: current={} goal={} income={}",
                     current_savings, goal_amount, monthly_income);
            return Result<SavingsPlan>::failure("Savings, goal, and income must be non-negative");
        }
    }
    if (timeframe_months == 0) {
        return Result<SavingsPlan>::failure("Timeframe must be positive");
    }
    if (timeframe_months > config_.max_timeframe_months) {
        return Result<SavingsPlan>::failure(
            fmt::format("Timeframe must not exceed {} months", config_.max_timeframe_months));
    }
    if (config_.trials == 0) {
        return Result<SavingsPlan>::failure("Simulation needs at least one trial");
    }

    const double months = static_cast<double>(timeframe_months);
    const double required = std::max(0.0, goal_amount - current_savings) / months;
    const double recommended = std::min(required, monthly_income * config_.affordable_fraction);

    SavingsPlan plan;
    plan.required_monthly    = stats::round_to_cents(required);
    plan.recommended_monthly = stats::round_to_cents(recommended);

    if (current_savings >= goal_amount) {
        plan.recommended_monthly = 0.0;
        plan.success_probability = 1.0;
        plan.p10_balance = plan.p50_balance = plan.p90_balance =
            stats::round_to_cents(current_savings);
        log.debug("Savings goal already met: {}", plan.to_string());
        return plan;
    }

    std::mt19937_64 gen(config_.seed ? *config_.seed : std::random_device{}());
    std::normal_distribution<double> monthly_return(
        config_.annual_return / constants::MONTHS_PER_YEAR,
        config_.annual_volatility / std::sqrt(constants::MONTHS_PER_YEAR));

    const auto trials = static_cast<Eigen::Index>(config_.trials);
    Eigen::ArrayXd balance = Eigen::ArrayXd::Constant(trials, current_savings);
    for (std::size_t m = 0; m < timeframe_months; ++m) {
        const Eigen::ArrayXd growth =
            Eigen::ArrayXd::NullaryExpr(trials, [&]() { return 1.0 + monthly_return(gen); });
        balance = balance * growth + recommended;
    }

    const auto hits = (balance >= goal_amount).count();
    const double success = static_cast<double>(hits) / static_cast<double>(trials);

    std::vector<double> sorted(balance.data(), balance.data() + balance.size());
    std::sort(sorted.begin(), sorted.end());

    plan.success_probability = std::round(success * 100.0) / 100.0;
    plan.reconsider_plan     = success < config_.reconsider_threshold;
    plan.p10_balance = stats::round_to_cents(stats::percentile_sorted(sorted, 0.10));
    plan.p50_balance = stats::round_to_cents(stats::percentile_sorted(sorted, 0.50));
    plan.p90_balance = stats::round_to_cents(stats::percentile_sorted(sorted, 0.90));
    log.debug("Savings plan: {}", plan.to_string());
    return plan;
}

}  // namespace finplan::advisors
