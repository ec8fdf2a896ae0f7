/**
 * @file  prop_emergency_dependents.cpp
 * @brief Property: ∀ history, ∀ d ≥ 0: range(d + 1) ⊇ range(d) in magnitude
 *
 * Adding a dependent never lowers the recommended minimum or maximum, and the
 * report stays well formed: min ≤ max, probability in [0, 1].
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_emergency_dependents
 */

#include <rapidcheck.h>
#include <vector>

#include "finplan/emergency.hpp"
#include "finplan/taxonomy.hpp"

using namespace finplan;
using namespace finplan::advisors;

// ── Generators ──────────────────────────────────────────────────────────────

static std::vector<TransactionRecord> gen_history() {
    const auto months = *rc::gen::inRange(1, 13);
    std::vector<TransactionRecord> out;
    for (int m = 1; m < months; ++m) {
        TransactionFields f;
        f.date        = *make_date(2023, static_cast<unsigned>(m), 10);
        f.description = "household";
        f.amount      = static_cast<double>(*rc::gen::inRange(1, 100'000));
        f.type        = TransactionType::Expense;
        f.category    = Category{"Housing", "rent"};
        auto rec = TransactionRecord::make(f, *CategoryTaxonomy::standard());
        RC_ASSERT(rec.has_value());
        out.push_back(std::move(rec).value());
    }
    if (out.empty()) {
        TransactionFields f;
        f.date        = *make_date(2023, 12, 10);
        f.description = "household";
        f.amount      = 1000.0;
        f.type        = TransactionType::Expense;
        f.category    = Category{"Housing", "rent"};
        out.push_back(std::move(TransactionRecord::make(f, *CategoryTaxonomy::standard())).value());
    }
    return out;
}

int main() {
    rc::check(
        "emergency_dependents: one more dependent never shrinks the range",
        [](bool variable) {
            const auto history   = gen_history();
            const auto stability = variable ? IncomeStability::Variable : IncomeStability::Stable;
            const int dependents = *rc::gen::inRange(0, 10);

            const EmergencyFundAdvisor advisor{};
            const auto base = advisor.recommend(history, stability, dependents);
            const auto more = advisor.recommend(history, stability, dependents + 1);
            RC_ASSERT(base.has_value());
            RC_ASSERT(more.has_value());

            RC_ASSERT(base->recommended_min <= base->recommended_max);
            RC_ASSERT(more->recommended_min >= base->recommended_min);
            RC_ASSERT(more->recommended_max >= base->recommended_max);
            RC_ASSERT(base->probability_sufficient >= 0.0);
            RC_ASSERT(base->probability_sufficient <= 1.0);
        }
    );

    rc::check(
        "emergency_dependents: variable income never lowers the range",
        [](int raw_dependents) {
            const auto history   = gen_history();
            const int dependents = (raw_dependents % 6 + 6) % 6;

            const EmergencyFundAdvisor advisor{};
            const auto stable   = advisor.recommend(history, IncomeStability::Stable, dependents);
            const auto variable = advisor.recommend(history, IncomeStability::Variable, dependents);
            RC_ASSERT(stable.has_value());
            RC_ASSERT(variable.has_value());
            RC_ASSERT(variable->recommended_max >= stable->recommended_max);
        }
    );

    return 0;
}
