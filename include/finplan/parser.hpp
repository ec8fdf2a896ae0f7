#pragma once

/// @file include/finplan/parser.hpp
/// @brief TransactionParser — natural-language utterance → transaction records.
///
/// # Module: Transaction Parser
///
/// ## Responsibility
/// Split an utterance such as
///
///     "paid 20 rupees for panipuris and 50 rupees for a movie ticket"
///
/// into clauses and turn each clause into a `TransactionRecord` or a
/// `ParseError`. Extraction is rule-based: an action-verb table decides the
/// direction, the first number is the amount, the phrase after a preposition
/// is the item (classified through `CategoryClassifier`), and fixed tables
/// resolve relative dates and group splits.
///
/// ## Clause carry
/// A clause that names no action verb reuses the verb of the closest
/// preceding clause in the same utterance. The carry is an explicit value
/// threaded through `parse_clause`; the parser holds no mutable state.
///
/// ## Guarantees
/// - `parse` never throws and returns at least one entry
/// - A failing clause never prevents its siblings from being parsed
/// - Thread-safe: every method is const
///
/// ## NOT Responsible For
/// - Storage (records are handed to a `storage::TransactionStore`)
/// - Language understanding beyond the literal keyword tables

#include "finplan/classifier.hpp"
#include "finplan/constants.hpp"
#include "finplan/storage.hpp"
#include "finplan/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace finplan {

// ─── Results ──────────────────────────────────────────────────────────────────

/// Outcome of one clause.
using ParseEntry = std::variant<TransactionRecord, ParseError>;

/// Aggregate outcome of one utterance.
enum class ParseStatus { Success, Partial, Error };

[[nodiscard]] std::string_view to_string(ParseStatus status) noexcept;

struct ParseReport {
    std::vector<TransactionRecord> transactions;
    std::vector<std::string>       errors;
    ParseStatus                    status = ParseStatus::Error;

    /// "Transactions processed" or "No transactions processed".
    [[nodiscard]] std::string message() const;
};

// ─── Configuration ────────────────────────────────────────────────────────────

struct ParserConfig {
    /// Date that relative phrases ("yesterday") are resolved against.
    /// Unset means the local date at the time of each `parse` call.
    std::optional<Date> reference_date;

    /// Currency used when the clause names none.
    std::string default_currency{constants::DEFAULT_CURRENCY};

    /// Recognise "15-11-2023", "2023-11-15", "11/15/23" style dates.
    bool recognize_absolute_dates = true;
};

// ─── TransactionParser ────────────────────────────────────────────────────────

class TransactionParser {
public:
    /// Action verb carried from one clause to the next.
    struct ClauseCarry {
        std::optional<std::string> action;
    };

    explicit TransactionParser(std::shared_ptr<const CategoryTaxonomy> taxonomy,
                               ParserConfig config = ParserConfig{});

    /// Parse an utterance into one entry per clause.
    [[nodiscard]] std::vector<ParseEntry> parse(std::string_view utterance) const;

    /// Parse one lower-cased, whitespace-collapsed clause.
    ///
    /// # Returns
    /// The clause outcome and the carry for the next clause (the clause's own
    /// action verb if it has one, otherwise `carry` unchanged).
    [[nodiscard]] std::pair<ParseEntry, ClauseCarry>
    parse_clause(const std::string& clause, const ClauseCarry& carry,
                 Date reference) const;

    /// Collect entries into a report without persisting anything.
    [[nodiscard]] static ParseReport summarize(const std::vector<ParseEntry>& entries);

    /// Parse, persist every record through `store`, and report. Records the
    /// store rejects are reported as errors instead of transactions.
    [[nodiscard]] ParseReport process(std::string_view utterance,
                                      storage::TransactionStore& store) const;

    [[nodiscard]] const CategoryClassifier& classifier() const noexcept { return classifier_; }

private:
    std::shared_ptr<const CategoryTaxonomy> taxonomy_;
    CategoryClassifier                      classifier_;
    ParserConfig                            config_;
};

}  // namespace finplan
