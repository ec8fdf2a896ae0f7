/// @file src/taxonomy/category_taxonomy.cpp
/// @brief Category tables, reverse index and keyword shortcuts.

#include "finplan/taxonomy.hpp"

#include "../core/text.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace finplan {

// ─── Built-in tables ──────────────────────────────────────────────────────────

namespace {

CategoryTaxonomy::Table standard_expense_table() {
    return {
        {"Housing",        {"rent", "mortgage", "property tax", "home insurance",
                            "maintenance", "repairs", "utilities", "maid"}},
        {"Transportation", {"car payment", "fuel", "public transit",
                            "vehicle maintenance", "vehicle insurance", "parking",
                            "tolls", "auto rickshaw", "metro"}},
        {"Food",           {"groceries", "dining out", "takeout", "coffee", "alcohol",
                            "snacks", "panipuris", "sabji", "dhaba", "sweets", "kirana"}},
        {"Healthcare",     {"health insurance", "doctor", "dentist", "pharmacy",
                            "hospital", "optical", "fitness", "ayurveda"}},
        {"Personal",       {"clothing", "entertainment", "hobbies", "subscriptions",
                            "gifts", "beauty", "electronics", "movie ticket", "jewelry"}},
        {"Debt",           {"credit card", "student loan", "personal loan", "payday loan",
                            "debt consolidation", "EMI"}},
        {"Savings",        {"emergency fund", "retirement", "investments",
                            "education fund", "vacation fund", "FD", "RD"}},
        {"Education",      {"tuition", "books", "supplies", "courses", "software",
                            "conferences", "coaching"}},
        {"Charity",        {"donations", "religious", "political", "community support",
                            "temple", "pooja"}},
        {"Miscellaneous",  {"pet care", "child care", "legal fees", "taxes", "fines",
                            "unexpected", "festivals"}},
    };
}

CategoryTaxonomy::Table standard_income_table() {
    return {
        {"Employment",  {"salary", "wages", "bonus", "commission", "tips", "overtime",
                         "stipend"}},
        {"Business",    {"self-employment", "freelance", "consulting", "sales",
                         "royalties", "shop income"}},
        {"Investments", {"dividends", "interest", "capital gains", "rental income",
                         "retirement", "MF returns"}},
        {"Government",  {"social security", "unemployment", "disability", "stimulus",
                         "tax refund", "pension"}},
        {"Other",       {"gifts", "inheritance", "lottery", "alimony", "crowdfunding",
                         "reimbursement", "wedding gift"}},
    };
}

std::vector<CategoryTaxonomy::KeywordRule> standard_keywords() {
    return {
        {"panipuris",    {"Food", "panipuris"}},
        {"movie",        {"Personal", "movie ticket"}},
        {"ticket",       {"Personal", "movie ticket"}},
        {"sabji",        {"Food", "sabji"}},
        {"groceries",    {"Food", "groceries"}},
        {"clothes",      {"Personal", "clothing"}},
        {"clothing",     {"Personal", "clothing"}},
        {"salary",       {"Employment", "salary"}},
        {"kirana",       {"Food", "kirana"}},
        {"dhaba",        {"Food", "dhaba"}},
        {"sweets",       {"Food", "sweets"}},
        {"auto",         {"Transportation", "auto rickshaw"}},
        {"rickshaw",     {"Transportation", "auto rickshaw"}},
        {"emi",          {"Debt", "EMI"}},
        {"gift",         {"Other", "gifts"}},
        {"wedding gift", {"Other", "wedding gift"}},
    };
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Result<CategoryTaxonomy::Index>
CategoryTaxonomy::build_index(Table table, std::string_view label) {
    Index idx;
    for (std::size_t m = 0; m < table.size(); ++m) {
        const auto& group = table[m];
        const std::string main_key = text::to_lower(text::trim(group.main));
        if (main_key.empty()) {
            return Result<Index>::failure(
                fmt::format("{} table: empty main category", label));
        }
        if (!idx.main_pos.emplace(main_key, m).second) {
            return Result<Index>::failure(
                fmt::format("{} table: duplicate main category '{}'", label, group.main));
        }
        for (std::size_t s = 0; s < group.subs.size(); ++s) {
            const std::string sub_key = text::to_lower(text::trim(group.subs[s]));
            if (sub_key.empty()) {
                return Result<Index>::failure(
                    fmt::format("{} table: empty subcategory under '{}'", label, group.main));
            }
            auto [it, inserted] = idx.sub_pos.emplace(sub_key, std::make_pair(m, s));
            if (!inserted) {
                return Result<Index>::failure(fmt::format(
                    "{} table: subcategory '{}' listed under both '{}' and '{}'",
                    label, group.subs[s], table[it->second.first].main, group.main));
            }
            idx.subs.push_back(group.subs[s]);
        }
    }
    idx.table = std::move(table);
    return idx;
}

Result<std::shared_ptr<const CategoryTaxonomy>>
CategoryTaxonomy::create(Table expense, Table income, std::vector<KeywordRule> keywords) {
    using Out = Result<std::shared_ptr<const CategoryTaxonomy>>;

    auto expense_idx = build_index(std::move(expense), "expense");
    if (!expense_idx) return Out::failure(expense_idx.error());
    auto income_idx = build_index(std::move(income), "income");
    if (!income_idx) return Out::failure(income_idx.error());

    auto taxonomy = std::make_shared<CategoryTaxonomy>(ConstructionTag{});
    taxonomy->expense_ = std::move(expense_idx).value();
    taxonomy->income_  = std::move(income_idx).value();

    for (auto& rule : keywords) {
        rule.keyword = text::to_lower(text::trim(rule.keyword));
        if (rule.keyword.empty()) {
            return Out::failure("keyword rule with empty keyword");
        }
        if (!taxonomy->validate(TransactionType::Expense, rule.category.main, rule.category.sub) &&
            !taxonomy->validate(TransactionType::Income, rule.category.main, rule.category.sub)) {
            return Out::failure(fmt::format("keyword '{}' maps to unknown pair {}/{}",
                                            rule.keyword, rule.category.main,
                                            rule.category.sub));
        }
    }
    // Longest key first so "wedding gift" wins over "gift".
    std::stable_sort(keywords.begin(), keywords.end(),
                     [](const KeywordRule& a, const KeywordRule& b) {
                         return a.keyword.size() > b.keyword.size();
                     });
    taxonomy->keywords_ = std::move(keywords);

    return std::shared_ptr<const CategoryTaxonomy>(std::move(taxonomy));
}

std::shared_ptr<const CategoryTaxonomy> CategoryTaxonomy::standard() {
    static const std::shared_ptr<const CategoryTaxonomy> instance = [] {
        auto built = create(standard_expense_table(), standard_income_table(),
                            standard_keywords());
        // The built-in tables satisfy every invariant create() checks.
        return std::move(built).value();
    }();
    return instance;
}

// ─── Lookups ──────────────────────────────────────────────────────────────────

const CategoryTaxonomy::Table&
CategoryTaxonomy::table(TransactionType type) const noexcept {
    return index(type).table;
}

const std::vector<std::string>&
CategoryTaxonomy::subcategories(TransactionType type) const noexcept {
    return index(type).subs;
}

bool CategoryTaxonomy::validate(TransactionType type,
                                std::string_view main,
                                std::string_view sub) const {
    const Index& idx = index(type);
    const auto m = idx.main_pos.find(text::to_lower(main));
    if (m == idx.main_pos.end()) return false;
    const auto s = idx.sub_pos.find(text::to_lower(sub));
    return s != idx.sub_pos.end() && s->second.first == m->second;
}

std::optional<std::string>
CategoryTaxonomy::main_category_of(TransactionType type, std::string_view sub) const {
    const Index& idx = index(type);
    const auto s = idx.sub_pos.find(text::to_lower(sub));
    if (s == idx.sub_pos.end()) return std::nullopt;
    return idx.table[s->second.first].main;
}

std::optional<Category>
CategoryTaxonomy::canonical(TransactionType type,
                            std::string_view main,
                            std::string_view sub) const {
    if (!validate(type, main, sub)) return std::nullopt;
    const Index& idx = index(type);
    const auto [m, s] = idx.sub_pos.at(text::to_lower(sub));
    return Category{idx.table[m].main, idx.table[m].subs[s]};
}

}  // namespace finplan
