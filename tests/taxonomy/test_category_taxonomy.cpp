/// @file tests/taxonomy/test_category_taxonomy.cpp
/// @brief Tests for CategoryTaxonomy construction and lookups.

#include "finplan/taxonomy.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>

using namespace finplan;

namespace {

CategoryTaxonomy::Table small_expense() {
    return {{"Food", {"coffee", "snacks"}}, {"Housing", {"rent"}}};
}

CategoryTaxonomy::Table small_income() {
    return {{"Employment", {"salary"}}, {"Other", {"gifts"}}};
}

}  // namespace

// ─── Built-in taxonomy ────────────────────────────────────────────────────────

TEST(CategoryTaxonomyStandard, SameInstanceEveryCall) {
    EXPECT_EQ(CategoryTaxonomy::standard().get(), CategoryTaxonomy::standard().get());
}

TEST(CategoryTaxonomyStandard, ValidatesKnownPairs) {
    const auto tax = CategoryTaxonomy::standard();
    EXPECT_TRUE(tax->validate(TransactionType::Expense, "Food", "panipuris"));
    EXPECT_TRUE(tax->validate(TransactionType::Expense, "housing", "RENT"));
    EXPECT_TRUE(tax->validate(TransactionType::Income, "Employment", "salary"));
    EXPECT_TRUE(tax->validate(TransactionType::Income, "Other", "reimbursement"));
}

TEST(CategoryTaxonomyStandard, RejectsCrossTypeAndMismatchedPairs) {
    const auto tax = CategoryTaxonomy::standard();
    EXPECT_FALSE(tax->validate(TransactionType::Income, "Food", "coffee"));
    EXPECT_FALSE(tax->validate(TransactionType::Expense, "Employment", "salary"));
    EXPECT_FALSE(tax->validate(TransactionType::Expense, "Food", "rent"));
    EXPECT_FALSE(tax->validate(TransactionType::Expense, "Nowhere", "coffee"));
}

TEST(CategoryTaxonomyStandard, SubcategoriesUniqueWithinType) {
    const auto tax = CategoryTaxonomy::standard();
    for (auto type : {TransactionType::Expense, TransactionType::Income}) {
        std::unordered_map<std::string, int> seen;
        for (const auto& sub : tax->subcategories(type)) {
            std::string key = sub;
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            EXPECT_EQ(++seen[key], 1) << "duplicate subcategory " << sub;
        }
    }
}

TEST(CategoryTaxonomyStandard, SameLabelAllowedAcrossTypes) {
    const auto tax = CategoryTaxonomy::standard();
    EXPECT_EQ(tax->main_category_of(TransactionType::Expense, "gifts"), "Personal");
    EXPECT_EQ(tax->main_category_of(TransactionType::Income, "gifts"), "Other");
    EXPECT_EQ(tax->main_category_of(TransactionType::Expense, "retirement"), "Savings");
    EXPECT_EQ(tax->main_category_of(TransactionType::Income, "retirement"), "Investments");
}

TEST(CategoryTaxonomyStandard, EveryKeywordTargetsAValidPair) {
    const auto tax = CategoryTaxonomy::standard();
    ASSERT_FALSE(tax->keywords().empty());
    for (const auto& rule : tax->keywords()) {
        const bool ok =
            tax->validate(TransactionType::Expense, rule.category.main, rule.category.sub) ||
            tax->validate(TransactionType::Income, rule.category.main, rule.category.sub);
        EXPECT_TRUE(ok) << rule.keyword;
    }
}

TEST(CategoryTaxonomyStandard, KeywordsLongestFirst) {
    const auto& kw = CategoryTaxonomy::standard()->keywords();
    for (std::size_t i = 1; i < kw.size(); ++i) {
        EXPECT_GE(kw[i - 1].keyword.size(), kw[i].keyword.size());
    }
    EXPECT_EQ(kw.front().keyword, "wedding gift");
}

TEST(CategoryTaxonomyStandard, CanonicalSpelling) {
    const auto tax = CategoryTaxonomy::standard();
    const auto c = tax->canonical(TransactionType::Expense, "debt", "emi");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->main, "Debt");
    EXPECT_EQ(c->sub, "EMI");
    EXPECT_FALSE(tax->canonical(TransactionType::Income, "debt", "emi").has_value());
}

// ─── Custom tables ────────────────────────────────────────────────────────────

TEST(CategoryTaxonomyCreate, AcceptsConsistentTables) {
    auto tax = CategoryTaxonomy::create(small_expense(), small_income(),
                                        {{"latte", {"Food", "coffee"}}});
    ASSERT_TRUE(tax.has_value()) << tax.error();
    EXPECT_EQ((*tax)->subcategories(TransactionType::Expense).size(), 3u);
    EXPECT_EQ((*tax)->keywords().front().keyword, "latte");
}

TEST(CategoryTaxonomyCreate, OnlyReachableThroughFactories) {
    EXPECT_FALSE(std::is_default_constructible_v<CategoryTaxonomy>);
    const auto created = CategoryTaxonomy::create(small_expense(), small_income(), {});
    ASSERT_TRUE(created.has_value()) << created.error();
    const std::shared_ptr<const CategoryTaxonomy> shared = *created;
    ASSERT_NE(shared, nullptr);
    EXPECT_TRUE(shared->validate(TransactionType::Expense, "Housing", "rent"));
}

TEST(CategoryTaxonomyCreate, RejectsDuplicateSubcategory) {
    auto expense = small_expense();
    expense[1].subs.push_back("Coffee");
    auto tax = CategoryTaxonomy::create(expense, small_income(), {});
    ASSERT_FALSE(tax.has_value());
    EXPECT_NE(tax.error().find("coffee"), std::string::npos);
}

TEST(CategoryTaxonomyCreate, RejectsDuplicateMain) {
    auto expense = small_expense();
    expense.push_back({"food", {"tea"}});
    EXPECT_FALSE(CategoryTaxonomy::create(expense, small_income(), {}).has_value());
}

TEST(CategoryTaxonomyCreate, RejectsEmptyLabels) {
    auto expense = small_expense();
    expense[0].subs.push_back("  ");
    EXPECT_FALSE(CategoryTaxonomy::create(expense, small_income(), {}).has_value());
}

TEST(CategoryTaxonomyCreate, RejectsKeywordWithUnknownPair) {
    auto tax = CategoryTaxonomy::create(small_expense(), small_income(),
                                        {{"latte", {"Food", "tea"}}});
    EXPECT_FALSE(tax.has_value());
    tax = CategoryTaxonomy::create(small_expense(), small_income(),
                                   {{" ", {"Food", "coffee"}}});
    EXPECT_FALSE(tax.has_value());
}
