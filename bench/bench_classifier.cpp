/**
 * @file  bench/bench_classifier.cpp
 * @brief Google Benchmark suite for the classification and parsing hot paths.
 *
 * Module:  bench/
 *
 * Benchmarks
 * ----------
 *   BM_WeightedRatio            — single pairwise score
 *   BM_BestMatch_Subcategories  — one query against a type's subcategories
 *   BM_Classify_Keyword / Phrase / Word / Fallback
 *   BM_Parse_Utterance          — N-clause utterance end to end
 *   BM_Store_BulkInsert         — dedupe-on-insert cost
 *
 * Build (CMake):
 *   cmake -DFINPLAN_BUILD_BENCHMARKS=ON ..
 *   cmake --build build --target bench_classifier
 *   ./build/bench_classifier --benchmark_format=json
 *
 * Throughput units: items/second (descriptions or clauses processed).
 */

#include "benchmark/benchmark.h"

#include "finplan/classifier.hpp"
#include "finplan/parser.hpp"
#include "finplan/similarity.hpp"
#include "finplan/storage.hpp"

#include <cstddef>
#include <string>
#include <vector>

using namespace finplan;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Utterance of `n` clauses cycling through a few typical phrasings.
static std::string make_utterance(std::size_t n) {
    static const char* clauses[] = {
        "paid 20 rupees for panipuris",
        "spent $12.50 on coffee yesterday",
        "received 200 from deepak",
        "paid 1200 for dinner with friends",
        "bought groceries for 850 on 2024-03-02",
    };
    std::string out;
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) out += " and ";
        out += clauses[i % 5];
    }
    return out;
}

/// `n` distinct expense records spread over January 2024.
static std::vector<TransactionRecord> make_records(std::size_t n) {
    const auto taxonomy = CategoryTaxonomy::standard();
    std::vector<TransactionRecord> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        TransactionFields f;
        f.date        = *make_date(2024, 1, static_cast<unsigned>(i % 31 + 1));
        f.description = "groceries #" + std::to_string(i);
        f.amount      = 10.0 + static_cast<double>(i);
        f.type        = TransactionType::Expense;
        f.category    = Category{"Food", "groceries"};
        out.push_back(std::move(TransactionRecord::make(f, *taxonomy)).value());
    }
    return out;
}

// ── Similarity ─────────────────────────────────────────────────────────────────

static void BM_WeightedRatio(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(similarity::weighted_ratio("monthly rent payment", "rent"));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_WeightedRatio);

static void BM_BestMatch_Subcategories(benchmark::State& state) {
    const auto& subs = CategoryTaxonomy::standard()->subcategories(TransactionType::Expense);
    for (auto _ : state) {
        benchmark::DoNotOptimize(similarity::best_match("doctr visit", subs));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
    state.counters["candidates"] = static_cast<double>(subs.size());
}
BENCHMARK(BM_BestMatch_Subcategories);

// ── Classifier stages ──────────────────────────────────────────────────────────

static void classify_loop(benchmark::State& state, const char* description) {
    const CategoryClassifier classifier(CategoryTaxonomy::standard());
    for (auto _ : state) {
        benchmark::DoNotOptimize(classifier.classify(description, TransactionType::Expense));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_Classify_Keyword(benchmark::State& state)  { classify_loop(state, "movie ticket"); }
static void BM_Classify_Phrase(benchmark::State& state)   { classify_loop(state, "Coffee"); }
static void BM_Classify_Word(benchmark::State& state)     { classify_loop(state, "paid the dentst"); }
static void BM_Classify_Fallback(benchmark::State& state) { classify_loop(state, "zzz qqq xxx"); }
BENCHMARK(BM_Classify_Keyword);
BENCHMARK(BM_Classify_Phrase);
BENCHMARK(BM_Classify_Word);
BENCHMARK(BM_Classify_Fallback);

// ── Parser ─────────────────────────────────────────────────────────────────────

static void BM_Parse_Utterance(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    ParserConfig cfg;
    cfg.reference_date = make_date(2024, 3, 15);
    const TransactionParser parser(CategoryTaxonomy::standard(), cfg);
    const std::string utterance = make_utterance(n);
    for (auto _ : state) {
        auto entries = parser.parse(utterance);
        benchmark::DoNotOptimize(entries.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Parse_Utterance)->RangeMultiplier(4)->Range(1, 64)->Unit(benchmark::kMicrosecond);

// ── Storage ────────────────────────────────────────────────────────────────────

static void BM_Store_BulkInsert(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto records = make_records(n);
    for (auto _ : state) {
        storage::InMemoryTransactionStore store;
        auto inserted = store.add_transactions(records);
        benchmark::DoNotOptimize(inserted);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Store_BulkInsert)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
