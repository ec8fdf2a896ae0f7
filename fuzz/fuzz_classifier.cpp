/**
 * @file  fuzz_classifier.cpp
 * @brief libFuzzer target for CategoryClassifier and the similarity scorers
 *
 * Build:
 *   cmake -DFINPLAN_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_classifier
 *
 * Run for 60 seconds:
 *   ./fuzz_classifier -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. classify() returns a pair valid for both requested types.
 *   3. Fallback results report score 0; every other stage reports a score
 *      in [1, 100].
 *   4. Splitting the input at its midpoint, weighted_ratio of the halves is
 *      in [0, 100].
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "finplan/classifier.hpp"
#include "finplan/similarity.hpp"

using namespace finplan;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    static const auto taxonomy = CategoryTaxonomy::standard();
    static const CategoryClassifier classifier(taxonomy);

    for (auto type : {TransactionType::Expense, TransactionType::Income}) {
        const Classification c = classifier.explain(input, type);
        // Invariant 2
        assert(taxonomy->validate(type, c.category.main, c.category.sub));
        // Invariant 3
        if (c.stage == MatchStage::Fallback) {
            assert(c.score == 0);
            assert(c.category == classifier.fallback(type));
        } else {
            assert(c.score > 0 && c.score <= 100);
        }
    }

    // Invariant 4
    const auto half = input.size() / 2;
    const int score = similarity::weighted_ratio(input.substr(0, half), input.substr(half));
    assert(score >= 0 && score <= 100);

    return 0;
}
