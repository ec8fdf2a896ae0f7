/// @file tests/classifier/test_similarity.cpp
/// @brief Tests for the 0–100 string similarity scorers.

#include "finplan/similarity.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace finplan::similarity;

// ─── normalize ────────────────────────────────────────────────────────────────

TEST(SimilarityNormalize, LowersAndStripsPunctuation) {
    EXPECT_EQ(normalize("  Hello, World! "), "hello world");
    EXPECT_EQ(normalize("self-employment"), "self employment");
    EXPECT_EQ(normalize("\xE2\x82\xB9" "500 rs"), "500 rs");
    EXPECT_EQ(normalize("!!!"), "");
}

// ─── ratio family ─────────────────────────────────────────────────────────────

TEST(SimilarityRatio, KnownValues) {
    EXPECT_EQ(ratio("coffee", "coffee"), 100);
    EXPECT_EQ(ratio("coffee", "toffee"), 83);   // LCS 5 → 2·5/12
    EXPECT_EQ(ratio("abcd", "abce"), 75);       // LCS 3 → 2·3/8
    EXPECT_EQ(ratio("Coffee!", "coffee"), 100);
}

TEST(SimilarityRatio, EmptyInputScoresZero) {
    EXPECT_EQ(ratio("", "coffee"), 0);
    EXPECT_EQ(ratio("...", "coffee"), 0);
    EXPECT_EQ(weighted_ratio("", ""), 0);
    EXPECT_EQ(partial_ratio("", "x"), 0);
}

TEST(SimilarityPartialRatio, SubstringScoresPerfect) {
    EXPECT_EQ(partial_ratio("cof", "coffee"), 100);
    EXPECT_EQ(partial_ratio("coffee", "cof"), 100);
    EXPECT_LT(partial_ratio("xyz", "coffee"), 50);
}

TEST(SimilarityTokenRatios, IgnoreWordOrderAndRepeats) {
    EXPECT_EQ(token_sort_ratio("new york mets", "mets new york"), 100);
    EXPECT_EQ(token_set_ratio("fuzzy was a bear", "fuzzy fuzzy was a bear"), 100);
    EXPECT_EQ(partial_token_sort_ratio("york new", "new york city"), 100);
    EXPECT_EQ(partial_token_set_ratio("york", "new york"), 100);
}

TEST(SimilarityWeightedRatio, ReorderedTokensAreDiscounted) {
    // Token-sort match counts at 0.95.
    EXPECT_EQ(weighted_ratio("new york mets", "mets new york"), 95);
    EXPECT_EQ(weighted_ratio("coffee", "coffee shop"), 90);
}

TEST(SimilarityScorers, AreSymmetric) {
    const std::vector<std::pair<std::string, std::string>> pairs = {
        {"coffee", "toffee"}, {"movie ticket", "ticket"},
        {"dining out", "out dining tonight"}, {"rent", "monthly rent payment"}};
    for (const auto& [a, b] : pairs) {
        EXPECT_EQ(ratio(a, b), ratio(b, a));
        EXPECT_EQ(partial_ratio(a, b), partial_ratio(b, a));
        EXPECT_EQ(token_sort_ratio(a, b), token_sort_ratio(b, a));
        EXPECT_EQ(token_set_ratio(a, b), token_set_ratio(b, a));
        EXPECT_EQ(weighted_ratio(a, b), weighted_ratio(b, a));
    }
}

TEST(SimilarityScorers, IdentityIsPerfect) {
    for (const char* s : {"a", "rent", "movie ticket", "Self-Employment"}) {
        EXPECT_EQ(weighted_ratio(s, s), 100) << s;
        EXPECT_EQ(token_set_ratio(s, s), 100) << s;
    }
}

// ─── best_match ───────────────────────────────────────────────────────────────

TEST(SimilarityBestMatch, EmptyCandidatesGiveNullopt) {
    EXPECT_FALSE(best_match("coffee", {}).has_value());
}

TEST(SimilarityBestMatch, PicksHighestScore) {
    const std::vector<std::string> cands = {"rent", "coffee", "snacks"};
    const auto m = best_match("snack", cands);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 2u);
    EXPECT_EQ(m->score, 91);
}

TEST(SimilarityBestMatch, EarliestWinsTies) {
    const std::vector<std::string> cands = {"coffee", "Coffee", "COFFEE"};
    const auto m = best_match("coffee", cands);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 0u);
    EXPECT_EQ(m->score, 100);
}

TEST(SimilarityBestMatch, NoOverlapStillReturnsACandidate) {
    const std::vector<std::string> cands = {"rent"};
    const auto m = best_match("!!!", cands);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 0u);
    EXPECT_EQ(m->score, 0);
}
