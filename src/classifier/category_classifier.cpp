/// @file src/classifier/category_classifier.cpp
/// @brief Layered keyword → phrase → word → fallback category classifier.

#include "finplan/classifier.hpp"
#include "finplan/logging.hpp"
#include "finplan/similarity.hpp"

#include "../core/text.hpp"

#include <string>

namespace finplan {

namespace {

/// Score reported for keyword shortcut and verbatim hits.
constexpr int KEYWORD_SCORE = 100;

}  // namespace

std::string_view to_string(MatchStage stage) noexcept {
    switch (stage) {
        case MatchStage::Keyword:  return "keyword";
        case MatchStage::Phrase:   return "phrase";
        case MatchStage::Word:     return "word";
        case MatchStage::Fallback: return "fallback";
    }
    return "fallback";
}

// ─── Construction ─────────────────────────────────────────────────────────────

CategoryClassifier::CategoryClassifier(std::shared_ptr<const CategoryTaxonomy> taxonomy,
                                       ClassifierConfig config)
    : taxonomy_(std::move(taxonomy))
    , config_(std::move(config))
{
    // Keep classify() total even under a misconfigured fallback.
    auto repair = [&](Category& fb, TransactionType type) {
        if (auto c = taxonomy_->canonical(type, fb.main, fb.sub)) {
            fb = std::move(*c);
            return;
        }
        const auto& table = taxonomy_->table(type);
        for (const auto& group : table) {
            if (!group.subs.empty()) {
                logging::logger()->warn(
                    "Fallback {}/{} is not a valid {} category; using {}/{}",
                    fb.main, fb.sub, to_string(type), group.main, group.subs.front());
                fb = Category{group.main, group.subs.front()};
                return;
            }
        }
    };
    repair(config_.expense_fallback, TransactionType::Expense);
    repair(config_.income_fallback, TransactionType::Income);
}

const Category& CategoryClassifier::fallback(TransactionType type) const noexcept {
    return type == TransactionType::Income ? config_.income_fallback
                                           : config_.expense_fallback;
}

// ─── Matching ─────────────────────────────────────────────────────────────────

std::optional<Classification>
CategoryClassifier::fuzzy_lookup(std::string_view query, TransactionType type,
                                 int threshold, MatchStage stage) const {
    const auto& subs = taxonomy_->subcategories(type);
    const auto match = similarity::best_match(query, subs);
    if (!match) return std::nullopt;

    const std::string& sub = subs[match->index];
    logging::logger()->debug("{} match: '{}' -> '{}' (score {})",
                             to_string(stage), query, sub, match->score);
    if (match->score < threshold) return std::nullopt;

    const auto main = taxonomy_->main_category_of(type, sub);
    if (!main || !taxonomy_->validate(type, *main, sub)) return std::nullopt;
    return Classification{Category{*main, sub}, stage, match->score};
}

std::optional<Classification>
CategoryClassifier::verbatim_lookup(std::string_view query, TransactionType type) const {
    const std::string padded = " " + similarity::normalize(query) + " ";
    const auto& subs = taxonomy_->subcategories(type);

    std::optional<std::size_t> best;
    std::size_t best_len = 0;
    for (std::size_t i = 0; i < subs.size(); ++i) {
        const std::string label = similarity::normalize(subs[i]);
        if (label.empty() || label.size() <= best_len) continue;
        if (padded.find(" " + label + " ") == std::string::npos) continue;
        best = i;
        best_len = label.size();
    }
    if (!best) return std::nullopt;

    const std::string& sub = subs[*best];
    const auto main = taxonomy_->main_category_of(type, sub);
    if (!main) return std::nullopt;
    logging::logger()->debug("verbatim match: '{}' -> '{}'", query, sub);
    return Classification{Category{*main, sub}, MatchStage::Phrase, KEYWORD_SCORE};
}

Classification CategoryClassifier::explain(std::string_view description,
                                           TransactionType type) const {
    const std::string lowered = text::to_lower(description);

    // Step 1: keyword shortcut.
    for (const auto& rule : taxonomy_->keywords()) {
        if (lowered.find(rule.keyword) == std::string::npos) continue;
        if (auto c = taxonomy_->canonical(type, rule.category.main, rule.category.sub)) {
            logging::logger()->debug("keyword match: '{}' -> {}/{}",
                                     rule.keyword, c->main, c->sub);
            return Classification{std::move(*c), MatchStage::Keyword, KEYWORD_SCORE};
        }
    }

    // Step 2: a subcategory named outright, then whole-phrase approximate match.
    if (KEYWORD_SCORE >= config_.phrase_threshold) {
        if (auto hit = verbatim_lookup(lowered, type)) return *hit;
    }
    if (auto hit = fuzzy_lookup(lowered, type, config_.phrase_threshold,
                                MatchStage::Phrase)) {
        return *hit;
    }

    // Step 3: word-level approximate match, in original token order.
    for (const auto& word : text::split_whitespace(lowered)) {
        if (word.size() < config_.min_token_length) continue;
        if (auto hit = fuzzy_lookup(word, type, config_.word_threshold,
                                    MatchStage::Word)) {
            return *hit;
        }
    }

    // Step 4: fallback.
    const Category& fb = fallback(type);
    logging::logger()->debug("fallback for '{}': {}/{}", description, fb.main, fb.sub);
    return Classification{fb, MatchStage::Fallback, 0};
}

Category CategoryClassifier::classify(std::string_view description,
                                      TransactionType type) const {
    return explain(description, type).category;
}

}  // namespace finplan
