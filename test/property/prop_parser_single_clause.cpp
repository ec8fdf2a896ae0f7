/**
 * @file  prop_parser_single_clause.cpp
 * @brief Property: ∀ N > 0: parse("paid N for coffee") = one expense of amount N
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_parser_single_clause
 *
 * Also checks that parse() is total: any utterance yields at least one entry
 * and every record it produces carries a category valid for its type.
 */

#include <rapidcheck.h>
#include <string>
#include <variant>

#include "finplan/parser.hpp"

using namespace finplan;

int main() {
    const auto taxonomy = CategoryTaxonomy::standard();
    ParserConfig cfg;
    cfg.reference_date = *make_date(2024, 3, 15);
    const TransactionParser parser(taxonomy, cfg);

    // ── Property 1: a single expense clause keeps its amount ────────────────
    rc::check(
        "parser_single_clause: 'paid N for coffee' yields one expense of N",
        [&]() {
            const int amount = *rc::gen::inRange(1, 1'000'000);
            const auto entries = parser.parse("paid " + std::to_string(amount) + " for coffee");
            RC_ASSERT(entries.size() == 1u);
            const auto* rec = std::get_if<TransactionRecord>(&entries[0]);
            RC_ASSERT(rec != nullptr);
            RC_ASSERT(rec->amount() == static_cast<double>(amount));
            RC_ASSERT(rec->type() == TransactionType::Expense);
            RC_ASSERT(rec->date() == *cfg.reference_date);
        }
    );

    // ── Property 2: income verbs flip the type, nothing else ────────────────
    rc::check(
        "parser_single_clause: 'received N from deepak' yields one income of N",
        [&]() {
            const int amount = *rc::gen::inRange(1, 1'000'000);
            const auto entries =
                parser.parse("received " + std::to_string(amount) + " from deepak");
            RC_ASSERT(entries.size() == 1u);
            const auto* rec = std::get_if<TransactionRecord>(&entries[0]);
            RC_ASSERT(rec != nullptr);
            RC_ASSERT(rec->amount() == static_cast<double>(amount));
            RC_ASSERT(rec->type() == TransactionType::Income);
        }
    );

    // ── Property 3: parse() is total ────────────────────────────────────────
    rc::check(
        "parser_single_clause: arbitrary input never throws and yields valid records",
        [&](const std::string& utterance) {
            const auto entries = parser.parse(utterance);
            RC_ASSERT(!entries.empty());
            for (const auto& e : entries) {
                if (const auto* rec = std::get_if<TransactionRecord>(&e)) {
                    RC_ASSERT(rec->amount() > 0.0);
                    RC_ASSERT(taxonomy->validate(rec->type(), rec->category().main,
                                                 rec->category().sub));
                }
            }
        }
    );

    return 0;
}
