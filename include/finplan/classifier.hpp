#pragma once

/// @file include/finplan/classifier.hpp
/// @brief CategoryClassifier — free text → (main, sub) category pair.
///
/// # Module: Category Classifier
///
/// ## Algorithm (first validating hit wins)
/// 1. Keyword shortcut: taxonomy keywords tested as substrings of the
///    lower-cased description, longest first.
/// 2. Phrase match: a subcategory whose words appear whole and in order in
///    the description scores 100 (longest label first, so "vehicle
///    maintenance" beats "maintenance" and "fd" is found despite its length).
///    Otherwise the best `weighted_ratio` of the whole description against
///    every subcategory of the requested type, accepted at ≥ 80.
/// 3. Word match: each whitespace token (≥ 3 characters) in order, accepted
///    at ≥ 85.
/// 4. Fallback: ("Miscellaneous", "unexpected") for expenses,
///    ("Other", "reimbursement") for income.
///
/// A candidate is accepted only if `CategoryTaxonomy::validate` holds for the
/// requested type.
///
/// ## Guarantees
/// - Total: `classify` always returns a pair valid for the requested type
/// - Pure and const; one instance may serve many threads
///
/// ## NOT Responsible For
/// - Splitting utterances or extracting the item phrase (see parser.hpp)

#include "finplan/constants.hpp"
#include "finplan/taxonomy.hpp"
#include "finplan/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace finplan {

/// Tunables for `CategoryClassifier`.
struct ClassifierConfig {
    int         phrase_threshold = constants::PHRASE_MATCH_THRESHOLD;
    int         word_threshold   = constants::WORD_MATCH_THRESHOLD;
    std::size_t min_token_length = constants::MIN_MATCH_TOKEN_LENGTH;

    Category expense_fallback{"Miscellaneous", "unexpected"};
    Category income_fallback{"Other", "reimbursement"};
};

/// Which rule produced a classification.
enum class MatchStage { Keyword, Phrase, Word, Fallback };

[[nodiscard]] std::string_view to_string(MatchStage stage) noexcept;

/// Classification plus the rule that produced it.
struct Classification {
    Category   category;
    MatchStage stage;
    int        score;  ///< Similarity score; 100 for keyword hits, 0 for fallback
};

class CategoryClassifier {
public:
    /// # Arguments
    /// * `taxonomy` — shared, immutable taxonomy (must not be null)
    /// * `config`   — thresholds and fallback pairs. A fallback pair that is
    ///                not valid for its type is replaced by the first
    ///                subcategory of the type's first main category.
    explicit CategoryClassifier(std::shared_ptr<const CategoryTaxonomy> taxonomy,
                                ClassifierConfig config = ClassifierConfig{});

    /// Resolve `description` to a category pair valid for `type`.
    [[nodiscard]] Category classify(std::string_view description,
                                    TransactionType type) const;

    /// As `classify`, also reporting which rule matched.
    [[nodiscard]] Classification explain(std::string_view description,
                                         TransactionType type) const;

    /// The pair returned when nothing matches.
    [[nodiscard]] const Category& fallback(TransactionType type) const noexcept;

    [[nodiscard]] const CategoryTaxonomy& taxonomy() const noexcept { return *taxonomy_; }

private:
    /// Longest subcategory named word-for-word inside `query`.
    [[nodiscard]] std::optional<Classification>
    verbatim_lookup(std::string_view query, TransactionType type) const;

    /// Best subcategory for `query` if it scores ≥ `threshold` and validates.
    [[nodiscard]] std::optional<Classification>
    fuzzy_lookup(std::string_view query, TransactionType type,
                 int threshold, MatchStage stage) const;

    std::shared_ptr<const CategoryTaxonomy> taxonomy_;
    ClassifierConfig                        config_;
};

}  // namespace finplan
