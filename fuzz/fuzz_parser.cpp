/**
 * @file  fuzz_parser.cpp
 * @brief libFuzzer target for TransactionParser::parse (utterance → entries)
 *
 * Build:
 *   cmake -DFINPLAN_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. parse() returns at least one entry.
 *   3. Every record:
 *      a. amount > 0 and finite
 *      b. category valid for the record's type
 *      c. non-empty description and currency
 *      d. split ratio in (0, 1]
 *   4. Every error carries a non-empty reason.
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view.  The clause splitter and
 *   the amount, date and person extractors must handle:
 *     • Binary garbage (null bytes, high bytes, partial UTF-8 such as a
 *       truncated rupee sign)
 *     • Runs of separators ("and and ,,, ;")
 *     • Oversized numbers ("1e400", "99999999999999999999")
 *     • Impossible dates ("2024-02-30", "31/31/2024")
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>

#include "finplan/parser.hpp"

using namespace finplan;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    static const auto taxonomy = CategoryTaxonomy::standard();
    static const TransactionParser parser = [] {
        ParserConfig cfg;
        cfg.reference_date = make_date(2024, 3, 15);
        return TransactionParser(taxonomy, cfg);
    }();

    const auto entries = parser.parse(input);

    // Invariant 2
    assert(!entries.empty());

    for (const auto& entry : entries) {
        if (const auto* rec = std::get_if<TransactionRecord>(&entry)) {
            // Invariant 3a
            assert(rec->amount() > 0.0);
            assert(std::isfinite(rec->amount()));
            // Invariant 3b
            assert(taxonomy->validate(rec->type(), rec->main_category(), rec->sub_category()));
            // Invariant 3c
            assert(!rec->description().empty());
            assert(!rec->currency().empty());
            // Invariant 3d
            assert(rec->split().value() > 0.0);
            assert(rec->split().value() <= 1.0);
        } else {
            // Invariant 4
            assert(!std::get<ParseError>(entry).reason.empty());
        }
    }

    return 0;
}
