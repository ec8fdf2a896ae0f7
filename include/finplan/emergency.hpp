#pragma once

/// @file include/finplan/emergency.hpp
/// @brief EmergencyFundAdvisor — how much cash to keep in reserve.
///
/// # Module: Emergency Fund Advisor
///
/// ## Method
/// Expense records are bucketed into contiguous monthly totals (income
/// records are ignored). With mean `m` and sample stddev `s` (10 % of `m`
/// when there is a single month or no variation):
///
///     factor = 1 + 0.2 [variable income] + 0.1 · dependents
///     range  = [m · 3 · factor, m · 6 · factor]
///     P(sufficient) = Φ((range.max − 3 · (m + 2s)) / (s · √3))
///
/// The probability is a rough normal approximation of a three-month
/// high-expense buffer; it is reported as 0.5 when undefined.

#include "finplan/constants.hpp"
#include "finplan/result.hpp"
#include "finplan/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace finplan::advisors {

enum class IncomeStability { Stable, Variable };

[[nodiscard]] std::string_view to_string(IncomeStability stability) noexcept;

/// "stable" / "variable", case-insensitive.
[[nodiscard]] std::optional<IncomeStability>
parse_income_stability(std::string_view label) noexcept;

struct EmergencyFundConfig {
    double min_months               = constants::EMERGENCY_MIN_MONTHS;
    double max_months               = constants::EMERGENCY_MAX_MONTHS;
    double variable_income_loading  = constants::VARIABLE_INCOME_LOADING;
    double per_dependent_loading    = constants::PER_DEPENDENT_LOADING;
    double fallback_stddev_fraction = constants::FALLBACK_STDDEV_FRACTION;
};

struct EmergencyFundReport {
    double          recommended_min        = 0.0;
    double          recommended_max        = 0.0;
    double          avg_monthly_expense    = 0.0;
    double          probability_sufficient = 0.5;
    IncomeStability income_stability       = IncomeStability::Stable;
    int             dependents             = 0;

    [[nodiscard]] std::string to_string() const;
};

class EmergencyFundAdvisor {
public:
    explicit EmergencyFundAdvisor(EmergencyFundConfig config = EmergencyFundConfig{})
        : config_(config) {}

    /// # Errors
    /// No expense records, a non-finite or non-positive amount, or negative
    /// `dependents`.
    [[nodiscard]] Result<EmergencyFundReport>
    recommend(std::span<const TransactionRecord> expense_history,
              IncomeStability income_stability = IncomeStability::Stable,
              int dependents = 0) const;

private:
    EmergencyFundConfig config_;
};

}  // namespace finplan::advisors
