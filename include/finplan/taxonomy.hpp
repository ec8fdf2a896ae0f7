#pragma once

/// @file include/finplan/taxonomy.hpp
/// @brief Two-level category taxonomy for expense and income transactions.
///
/// # Module: Category Taxonomy
///
/// ## Responsibility
/// Hold the static (main category → subcategories) tables for both
/// transaction types, a reverse subcategory index per type, and the keyword
/// shortcut table consulted first by the classifier.
///
/// ## Invariants
/// - Within one type's table every subcategory (case-insensitive) belongs to
///   exactly one main category. The same label may appear under both types.
/// - Every keyword rule names a pair valid in at least one table.
/// - Immutable after construction; shared through
///   `std::shared_ptr<const CategoryTaxonomy>`.
///
/// ## NOT Responsible For
/// - Choosing a category for free text (see classifier.hpp)

#include "finplan/result.hpp"
#include "finplan/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace finplan {

class CategoryTaxonomy {
    /// Only `create` can name this, so only `create` can construct.
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    explicit CategoryTaxonomy(ConstructionTag) {}

    /// One main category and its subcategories, in declaration order.
    struct Group {
        std::string              main;
        std::vector<std::string> subs;
    };
    using Table = std::vector<Group>;

    /// Literal substring → category shortcut.
    struct KeywordRule {
        std::string keyword;
        Category    category;
    };

    /// Build a taxonomy from custom tables.
    ///
    /// # Returns
    /// The shared taxonomy, or an error naming the first duplicate
    /// subcategory, duplicate main category, empty label, or keyword rule
    /// whose pair is valid in neither table.
    [[nodiscard]] static Result<std::shared_ptr<const CategoryTaxonomy>>
    create(Table expense, Table income, std::vector<KeywordRule> keywords);

    /// The built-in taxonomy. Constructed once; every call returns the same
    /// instance.
    [[nodiscard]] static std::shared_ptr<const CategoryTaxonomy> standard();

    [[nodiscard]] const Table& table(TransactionType type) const noexcept;

    /// All subcategories valid for `type`, in table order.
    [[nodiscard]] const std::vector<std::string>&
    subcategories(TransactionType type) const noexcept;

    /// Keyword rules, longest keyword first (ties keep declaration order).
    [[nodiscard]] const std::vector<KeywordRule>& keywords() const noexcept {
        return keywords_;
    }

    /// True if `main` is a main category of `type`'s table and `sub` is
    /// listed under it. Case-insensitive on both sides.
    [[nodiscard]] bool validate(TransactionType type,
                                std::string_view main,
                                std::string_view sub) const;

    /// Main category owning `sub` within `type`'s table.
    [[nodiscard]] std::optional<std::string>
    main_category_of(TransactionType type, std::string_view sub) const;

    /// The pair in the taxonomy's own spelling, if valid for `type`.
    [[nodiscard]] std::optional<Category>
    canonical(TransactionType type, std::string_view main, std::string_view sub) const;

private:
    struct Index {
        Table table;
        std::vector<std::string> subs;
        /// lower(main) → position in `table`
        std::unordered_map<std::string, std::size_t> main_pos;
        /// lower(sub) → (main position, sub position)
        std::unordered_map<std::string, std::pair<std::size_t, std::size_t>> sub_pos;
    };

    [[nodiscard]] const Index& index(TransactionType type) const noexcept {
        return type == TransactionType::Income ? income_ : expense_;
    }

    [[nodiscard]] static Result<Index> build_index(Table table, std::string_view label);

    Index expense_;
    Index income_;
    std::vector<KeywordRule> keywords_;
};

}  // namespace finplan
