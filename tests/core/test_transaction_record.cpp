/// @file tests/core/test_transaction_record.cpp
/// @brief Unit tests for TransactionRecord::make validation and formatting.
///
/// Test categories:
///   - Valid records keep their fields and get canonical category spelling
///   - Every rejection rule (amount, description, category, split, labels)
///   - TransactionType / SplitRatio helpers
///   - to_string formats

#include <gtest/gtest.h>
#include "finplan/taxonomy.hpp"
#include "finplan/types.hpp"

#include <cmath>
#include <limits>

using namespace finplan;

namespace {

TransactionFields coffee() {
    TransactionFields f;
    f.date        = *make_date(2024, 3, 1);
    f.description = "coffee";
    f.amount      = 120.0;
    f.category    = Category{"Food", "coffee"};
    f.type        = TransactionType::Expense;
    return f;
}

const CategoryTaxonomy& taxonomy() {
    return *CategoryTaxonomy::standard();
}

}  // namespace

// ─── Valid records ────────────────────────────────────────────────────────────

TEST(TransactionRecord, ValidRecordKeepsFields) {
    auto r = TransactionRecord::make(coffee(), taxonomy());
    ASSERT_TRUE(r.has_value()) << r.error();
    EXPECT_EQ(r->date(), *make_date(2024, 3, 1));
    EXPECT_EQ(r->description(), "coffee");
    EXPECT_DOUBLE_EQ(r->amount(), 120.0);
    EXPECT_EQ(r->currency(), "INR");
    EXPECT_EQ(r->main_category(), "Food");
    EXPECT_EQ(r->sub_category(), "coffee");
    EXPECT_EQ(r->type(), TransactionType::Expense);
    EXPECT_FALSE(r->person().has_value());
    EXPECT_FALSE(r->group().has_value());
    EXPECT_TRUE(r->split().whole());
}

TEST(TransactionRecord, CategoryIsCanonicalised) {
    auto f = coffee();
    f.category = Category{"food", "COFFEE"};
    auto r = TransactionRecord::make(f, taxonomy());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->category(), (Category{"Food", "coffee"}));
}

TEST(TransactionRecord, DescriptionIsTrimmed) {
    auto f = coffee();
    f.description = "  morning coffee \t";
    auto r = TransactionRecord::make(f, taxonomy());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->description(), "morning coffee");
}

TEST(TransactionRecord, GroupWithSplitAccepted) {
    auto f = coffee();
    f.group = "friends";
    f.split = SplitRatio{1, 4};
    auto r = TransactionRecord::make(f, taxonomy());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r->group(), "friends");
    EXPECT_DOUBLE_EQ(r->split().value(), 0.25);
}

// ─── Rejections ───────────────────────────────────────────────────────────────

TEST(TransactionRecord, RejectsNonPositiveAmount) {
    for (double bad : {0.0, -5.0, std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity()}) {
        auto f = coffee();
        f.amount = bad;
        EXPECT_FALSE(TransactionRecord::make(f, taxonomy()).has_value()) << bad;
    }
}

TEST(TransactionRecord, RejectsBlankDescription) {
    auto f = coffee();
    f.description = "   ";
    auto r = TransactionRecord::make(f, taxonomy());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "Missing required field: description");
}

TEST(TransactionRecord, RejectsInvalidDate) {
    auto f = coffee();
    f.date = Date{};
    EXPECT_FALSE(TransactionRecord::make(f, taxonomy()).has_value());
}

TEST(TransactionRecord, RejectsCategoryOfOtherType) {
    auto f = coffee();
    f.category = Category{"Employment", "salary"};
    auto r = TransactionRecord::make(f, taxonomy());
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().find("Invalid expense category"), std::string::npos);
}

TEST(TransactionRecord, RejectsSubUnderWrongMain) {
    auto f = coffee();
    f.category = Category{"Housing", "coffee"};
    EXPECT_FALSE(TransactionRecord::make(f, taxonomy()).has_value());
}

TEST(TransactionRecord, RejectsPartialSplitWithoutGroup) {
    auto f = coffee();
    f.split = SplitRatio{1, 2};
    auto r = TransactionRecord::make(f, taxonomy());
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "Split ratio requires a group");
}

TEST(TransactionRecord, RejectsInvalidSplit) {
    auto f = coffee();
    f.group = "common";
    f.split = SplitRatio{3, 2};
    EXPECT_FALSE(TransactionRecord::make(f, taxonomy()).has_value());
    f.split = SplitRatio{1, 0};
    EXPECT_FALSE(TransactionRecord::make(f, taxonomy()).has_value());
}

TEST(TransactionRecord, RejectsEmptyLabels) {
    auto f = coffee();
    f.person = " ";
    EXPECT_FALSE(TransactionRecord::make(f, taxonomy()).has_value());
    f = coffee();
    f.group = "";
    EXPECT_FALSE(TransactionRecord::make(f, taxonomy()).has_value());
}

TEST(TransactionRecord, RejectsEmptyCurrency) {
    auto f = coffee();
    f.currency = "";
    EXPECT_FALSE(TransactionRecord::make(f, taxonomy()).has_value());
}

// ─── Helpers and formatting ───────────────────────────────────────────────────

TEST(TransactionType, ParseIsCaseInsensitive) {
    EXPECT_EQ(parse_transaction_type("Income"), TransactionType::Income);
    EXPECT_EQ(parse_transaction_type(" EXPENSE "), TransactionType::Expense);
    EXPECT_FALSE(parse_transaction_type("transfer").has_value());
    EXPECT_EQ(to_string(TransactionType::Income), "income");
}

TEST(TransactionRecord, ToStringFormat) {
    auto f = coffee();
    f.person = "Asha";
    f.group  = "common";
    f.split  = SplitRatio{1, 2};
    auto r = TransactionRecord::make(f, taxonomy());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->to_string(),
              "2024-03-01 expense 120.00 INR Food/coffee 'coffee' person=Asha "
              "group=common split=1/2");
}

TEST(ParseError, ToStringNamesClause) {
    const ParseError e{"hello", "No action found"};
    EXPECT_EQ(e.to_string(), "No action found (clause: 'hello')");
}
