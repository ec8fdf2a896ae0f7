/**
 * @file  prop_debt_ordering.cpp
 * @brief Property: the payoff schedule follows the method's priority order
 *
 *   Avalanche: schedule rates are non-increasing
 *   Snowball:  schedule starting balances are non-decreasing
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_debt_ordering
 *
 * Generated minimum payments always exceed a month's interest by at least 20,
 * so every generated portfolio is paid off well inside the month limit.
 */

#include <rapidcheck.h>
#include <cstddef>
#include <string>
#include <vector>

#include "finplan/debt.hpp"

using namespace finplan::advisors;

// ── Generators ──────────────────────────────────────────────────────────────

static std::vector<Debt> gen_portfolio() {
    const auto count = *rc::gen::inRange<std::size_t>(1, 6);
    std::vector<Debt> debts;
    for (std::size_t i = 0; i < count; ++i) {
        const double balance = *rc::gen::inRange(0, 10'000);
        const double rate    = *rc::gen::inRange(0, 31) / 100.0;
        debts.push_back(Debt{balance, rate, balance * 0.05 + 20.0, std::to_string(i)});
    }
    return debts;
}

static const Debt& source_of(const std::vector<Debt>& debts, const DebtPayoff& p) {
    return debts[std::stoul(p.label)];
}

int main() {
    // ── Property 1: avalanche schedule by rate ──────────────────────────────
    rc::check(
        "debt_ordering: avalanche schedule is sorted by descending rate",
        []() {
            const auto debts = gen_portfolio();
            const auto plan = DebtOptimizer{}.optimize(debts, PayoffMethod::Avalanche);
            RC_ASSERT(plan.has_value());
            RC_ASSERT(plan->schedule.size() == debts.size());
            for (std::size_t i = 1; i < plan->schedule.size(); ++i) {
                RC_ASSERT(source_of(debts, plan->schedule[i - 1]).annual_rate >=
                          source_of(debts, plan->schedule[i]).annual_rate);
            }
        }
    );

    // ── Property 2: snowball schedule by balance ────────────────────────────
    rc::check(
        "debt_ordering: snowball schedule is sorted by ascending balance",
        []() {
            const auto debts = gen_portfolio();
            const auto plan = DebtOptimizer{}.optimize(debts, PayoffMethod::Snowball);
            RC_ASSERT(plan.has_value());
            for (std::size_t i = 1; i < plan->schedule.size(); ++i) {
                RC_ASSERT(source_of(debts, plan->schedule[i - 1]).balance <=
                          source_of(debts, plan->schedule[i]).balance);
            }
        }
    );

    // ── Property 3: the plan ends with its last payoff ──────────────────────
    rc::check(
        "debt_ordering: total_months equals the latest payoff month",
        [](bool snowball) {
            const auto debts = gen_portfolio();
            const auto plan = DebtOptimizer{}.optimize(
                debts, snowball ? PayoffMethod::Snowball : PayoffMethod::Avalanche);
            RC_ASSERT(plan.has_value());
            std::size_t last = 0;
            for (const auto& p : plan->schedule) {
                RC_ASSERT(p.interest_paid >= 0.0);
                if (p.payoff_month > last) last = p.payoff_month;
            }
            RC_ASSERT(last == plan->total_months);
            RC_ASSERT(plan->total_interest >= 0.0);
        }
    );

    // ── Property 4: no interest, and no month pays more than the pool ───────
    rc::check(
        "debt_ordering: interest-free portfolios cost nothing and need sum/pool months",
        [](bool snowball) {
            auto debts = gen_portfolio();
            double owed = 0.0;
            double pool = 0.0;
            for (auto& d : debts) {
                d.annual_rate = 0.0;
                d.min_payment = static_cast<double>(*rc::gen::inRange(20, 500));
                owed += d.balance;
                pool += d.min_payment;
            }
            const auto plan = DebtOptimizer{}.optimize(
                debts, snowball ? PayoffMethod::Snowball : PayoffMethod::Avalanche);
            RC_ASSERT(plan.has_value());
            RC_ASSERT(plan->total_interest == 0.0);
            RC_ASSERT(static_cast<double>(plan->total_months) * pool >= owed);
        }
    );

    return 0;
}
