/**
 * @file  fuzz_csv_loader.cpp
 * @brief libFuzzer target for CsvLoader (transaction and debt CSV text)
 *
 * Build:
 *   cmake -DFINPLAN_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_csv_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_csv_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every loaded transaction has a positive, finite amount and a category
 *      valid for its type.
 *   3. Every loaded debt has finite, non-negative balance, rate and payment.
 *   4. parse_split on the raw input yields nullopt or a ratio in (0, 1].
 *
 * Fuzzer strategy:
 *   The input is used as the whole file body, so the header row is fuzzed
 *   along with the data.  Seed the corpus with a valid header, e.g.
 *     date,description,amount,type,main_category,sub_category
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "finplan/csv_loader.hpp"

using namespace finplan;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    static const auto taxonomy = CategoryTaxonomy::standard();
    static const core::CsvLoader loader(taxonomy);

    // Invariant 2
    const auto txns = loader.parse_transactions(input);
    for (const auto& rec : txns.rows) {
        assert(rec.amount() > 0.0 && std::isfinite(rec.amount()));
        assert(taxonomy->validate(rec.type(), rec.main_category(), rec.sub_category()));
    }

    // Invariant 3
    const auto debts = core::CsvLoader::parse_debts(input);
    for (const auto& d : debts.rows) {
        assert(std::isfinite(d.balance) && d.balance >= 0.0);
        assert(std::isfinite(d.annual_rate) && d.annual_rate >= 0.0);
        assert(std::isfinite(d.min_payment) && d.min_payment >= 0.0);
    }

    // Invariant 4
    if (const auto split = core::CsvLoader::parse_split(std::string_view{input})) {
        assert(split->value() > 0.0 && split->value() <= 1.0);
    }

    return 0;
}
