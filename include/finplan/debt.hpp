#pragma once

/// @file include/finplan/debt.hpp
/// @brief DebtOptimizer — month-by-month payoff simulation under avalanche or
///        snowball ordering.
///
/// # Module: Debt Optimizer
///
/// ## Simulation
/// Debts are ordered once (stable):
///   - Avalanche: descending annual rate
///   - Snowball:  ascending balance
///
/// The monthly payment pool is the sum of every minimum payment. Each month:
///   1. every positive balance accrues `balance · rate / 12`
///   2. each debt, in priority order, receives min(min_payment, pool, balance)
///   3. whatever is left of the pool goes to the first debt still owing
///
/// ## Guarantees
/// - Terminates: a plan still owing after `max_months` is reported as an error
/// - Pure; the caller's debts are never modified

#include "finplan/constants.hpp"
#include "finplan/result.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace finplan::advisors {

struct Debt {
    double      balance     = 0.0;
    double      annual_rate = 0.0;  ///< Fraction, e.g. 0.18 for 18 %
    double      min_payment = 0.0;
    std::string label;              ///< Optional, used in the schedule
};

enum class PayoffMethod { Avalanche, Snowball };

/// "avalanche" / "snowball", case-insensitive.
[[nodiscard]] std::optional<PayoffMethod> parse_payoff_method(std::string_view label) noexcept;

/// "Avalanche (Highest Interest First)" / "Snowball (Lowest Balance First)".
[[nodiscard]] std::string_view method_name(PayoffMethod method) noexcept;

/// Outcome for one debt, in priority order.
struct DebtPayoff {
    std::string label;
    std::size_t payoff_month   = 0;    ///< Month the balance reached 0 (0 if it started at 0)
    double      interest_paid  = 0.0;
};

struct PayoffPlan {
    std::size_t             total_months   = 0;
    double                  total_interest = 0.0;  ///< Rounded to cents
    std::string             method_name;
    std::vector<DebtPayoff> schedule;

    [[nodiscard]] std::string to_string() const;
};

struct DebtConfig {
    std::size_t max_months = constants::MAX_PAYOFF_MONTHS;
};

class DebtOptimizer {
public:
    explicit DebtOptimizer(DebtConfig config = DebtConfig{}) : config_(config) {}

    /// # Errors
    /// - any balance, rate or minimum payment negative or non-finite
    /// - balance still outstanding after `max_months`
    [[nodiscard]] Result<PayoffPlan>
    optimize(std::span<const Debt> debts, PayoffMethod method = PayoffMethod::Avalanche) const;

private:
    DebtConfig config_;
};

}  // namespace finplan::advisors
