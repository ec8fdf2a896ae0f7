/// @file src/advisors/debt_optimizer.cpp
/// @brief Avalanche / snowball payoff simulation.

#include "finplan/debt.hpp"
#include "finplan/logging.hpp"

#include "../core/text.hpp"
#include "statistics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace finplan::advisors {

std::optional<PayoffMethod> parse_payoff_method(std::string_view label) noexcept {
    if (text::iequals(label, "avalanche")) return PayoffMethod::Avalanche;
    if (text::iequals(label, "snowball"))  return PayoffMethod::Snowball;
    return std::nullopt;
}

std::string_view method_name(PayoffMethod method) noexcept {
    switch (method) {
        case PayoffMethod::Avalanche: return "Avalanche (Highest Interest First)";
        case PayoffMethod::Snowball:  return "Snowball (Lowest Balance First)";
    }
    return "Avalanche (Highest Interest First)";
}

std::string PayoffPlan::to_string() const {
    return fmt::format("{}: {} months, total interest {:.2f}",
                       method_name, total_months, total_interest);
}

namespace {

struct Account {
    std::string label;
    double      balance;
    double      rate;
    double      min_payment;
    bool        owed;
    std::size_t payoff_month = 0;
    double      interest     = 0.0;
};

}  // namespace

Result<PayoffPlan> DebtOptimizer::optimize(std::span<const Debt> debts,
                                           PayoffMethod method) const {
    auto& log = *logging::logger();

    if (debts.empty()) {
        PayoffPlan plan;
        plan.method_name = "No debts provided";
        log.debug("Debt optimization: no debts");
        return plan;
    }

    std::vector<Account> accounts;
    accounts.reserve(debts.size());
    for (std::size_t i = 0; i < debts.size(); ++i) {
        const Debt& d = debts[i];
        const bool valid = std::isfinite(d.balance) && std::isfinite(d.annual_rate) &&
                           std::isfinite(d.min_payment) && d.balance >= 0.0 &&
                           d.annual_rate >= 0.0 && d.min_payment >= 0.0;
        if (!valid) {
            log.warn("Rejected debt #{}: balance={} rate={} min_payment={}",
                     i + 1, d.balance, d.annual_rate, d.min_payment);
            return Result<PayoffPlan>::failure("Debt values must be non-negative");
        }
        accounts.push_back(Account{
            d.label.empty() ? fmt::format("debt #{}", i + 1) : d.label,
            d.balance, d.annual_rate, d.min_payment, d.balance > 0.0});
    }

    if (method == PayoffMethod::Snowball) {
        std::stable_sort(accounts.begin(), accounts.end(),
                         [](const Account& a, const Account& b) { return a.balance < b.balance; });
    } else {
        std::stable_sort(accounts.begin(), accounts.end(),
                         [](const Account& a, const Account& b) { return a.rate > b.rate; });
    }

    double pool = 0.0;
    for (const auto& a : accounts) pool += a.min_payment;

    auto owing = [&] {
        return std::any_of(accounts.begin(), accounts.end(),
                           [](const Account& a) { return a.balance > 0.0; });
    };

    std::size_t months = 0;
    double total_interest = 0.0;
    while (owing()) {
        if (months >= config_.max_months) {
            log.warn("Debt payoff exceeds {} months", config_.max_months);
            return Result<PayoffPlan>::failure(
                fmt::format("Debt payoff exceeds {} months", config_.max_months));
        }
        ++months;

        for (auto& a : accounts) {
            if (a.balance <= 0.0) continue;
            const double interest = a.balance * a.rate / constants::MONTHS_PER_YEAR;
            a.balance += interest;
            a.interest += interest;
            total_interest += interest;
        }

        double available = pool;
        for (auto& a : accounts) {
            if (a.balance <= 0.0) continue;
            const double payment = std::min({a.min_payment, available, a.balance});
            a.balance = std::max(0.0, a.balance - payment);
            available -= payment;
        }

        for (auto& a : accounts) {
            if (a.balance > 0.0 && available > 0.0) {
                const double payment = std::min(a.balance, available);
                a.balance = std::max(0.0, a.balance - payment);
                available -= payment;
                break;
            }
        }

        for (auto& a : accounts) {
            if (a.owed && a.balance <= 0.0 && a.payoff_month == 0) {
                a.payoff_month = months;
            }
        }
    }

    PayoffPlan plan;
    plan.total_months   = months;
    plan.total_interest = stats::round_to_cents(total_interest);
    plan.method_name    = std::string(method_name(method));
    plan.schedule.reserve(accounts.size());
    for (const auto& a : accounts) {
        plan.schedule.push_back(DebtPayoff{a.label, a.payoff_month,
                                           stats::round_to_cents(a.interest)});
    }
    log.debug("Debt optimization result: {}", plan.to_string());
    return plan;
}

}  // namespace finplan::advisors
