/// @file src/advisors/emergency_fund_advisor.cpp
/// @brief Emergency-fund range and sufficiency estimate.

#include "finplan/emergency.hpp"
#include "finplan/logging.hpp"

#include "../core/text.hpp"
#include "statistics.hpp"

#include <fmt/format.h>

#include <cmath>
#include <vector>

namespace finplan::advisors {

std::string_view to_string(IncomeStability stability) noexcept {
    return stability == IncomeStability::Variable ? "variable" : "stable";
}

std::optional<IncomeStability> parse_income_stability(std::string_view label) noexcept {
    if (text::iequals(label, "stable"))   return IncomeStability::Stable;
    if (text::iequals(label, "variable")) return IncomeStability::Variable;
    return std::nullopt;
}

std::string EmergencyFundReport::to_string() const {
    return fmt::format("range=[{:.2f}, {:.2f}] avg_monthly_expense={:.2f} "
                       "probability_sufficient={:.2f} income={} dependents={}",
                       recommended_min, recommended_max, avg_monthly_expense,
                       probability_sufficient, advisors::to_string(income_stability),
                       dependents);
}

Result<EmergencyFundReport>
EmergencyFundAdvisor::recommend(std::span<const TransactionRecord> expense_history,
                                IncomeStability income_stability, int dependents) const {
    auto& log = *logging::logger();

    if (dependents < 0) {
        return Result<EmergencyFundReport>::failure("Dependents must be non-negative");
    }
    for (const auto& r : expense_history) {
        if (!std::isfinite(r.amount()) || r.amount() <= 0.0) {
            return Result<EmergencyFundReport>::failure(
                fmt::format("Malformed amount in expense history: {}", r.amount()));
        }
    }

    const std::vector<double> monthly =
        stats::monthly_totals(expense_history, TransactionType::Expense);
    if (monthly.empty()) {
        log.warn("No valid expense data for emergency fund");
        return Result<EmergencyFundReport>::failure("No valid expense data available");
    }

    const double avg = stats::mean(monthly);
    double sd = stats::sample_stddev(monthly).value_or(0.0);
    if (!(sd > 0.0)) sd = avg * config_.fallback_stddev_fraction;

    double factor = 1.0;
    if (income_stability == IncomeStability::Variable) factor += config_.variable_income_loading;
    factor += config_.per_dependent_loading * static_cast<double>(dependents);

    const double rec_min = avg * config_.min_months * factor;
    const double rec_max = avg * config_.max_months * factor;

    const double buffer = avg + 2.0 * sd;
    const double scale  = sd * std::sqrt(3.0);
    double probability = 0.5;
    if (scale > 0.0 && std::isfinite(scale)) {
        const double p = stats::normal_cdf((rec_max - 3.0 * buffer) / scale);
        if (std::isfinite(p)) probability = std::round(p * 100.0) / 100.0;
    }

    EmergencyFundReport report;
    report.recommended_min        = stats::round_to_cents(rec_min);
    report.recommended_max        = stats::round_to_cents(rec_max);
    report.avg_monthly_expense    = stats::round_to_cents(avg);
    report.probability_sufficient = probability;
    report.income_stability       = income_stability;
    report.dependents             = dependents;
    log.debug("Emergency fund result: {}", report.to_string());
    return report;
}

}  // namespace finplan::advisors
