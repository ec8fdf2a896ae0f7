#pragma once

/// @file include/finplan/types.hpp
/// @brief Shared value types for the finplan engine.
///
/// Every module includes this file. It defines the transaction record, the
/// category pair returned by the classifier, and the per-clause parse error.

#include "finplan/constants.hpp"
#include "finplan/date.hpp"
#include "finplan/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace finplan {

class CategoryTaxonomy;

// ─── Transaction Type ─────────────────────────────────────────────────────────

/// Direction of money flow relative to the recording party.
enum class TransactionType { Income, Expense };

/// "income" / "expense".
[[nodiscard]] std::string_view to_string(TransactionType type) noexcept;

/// Case-insensitive inverse of `to_string`.
[[nodiscard]] std::optional<TransactionType>
parse_transaction_type(std::string_view text) noexcept;

// ─── Category ─────────────────────────────────────────────────────────────────

/// A (main, sub) pair from the two-level taxonomy.
struct Category {
    std::string main;
    std::string sub;

    friend bool operator==(const Category&, const Category&) = default;
};

// ─── Split Ratio ──────────────────────────────────────────────────────────────

/// This party's share of a shared expense, as an exact fraction.
/// Valid when 0 < numerator ≤ denominator.
struct SplitRatio {
    int numerator   = 1;
    int denominator = 1;

    [[nodiscard]] double value() const noexcept {
        return static_cast<double>(numerator) / static_cast<double>(denominator);
    }
    [[nodiscard]] bool valid() const noexcept {
        return numerator > 0 && denominator > 0 && numerator <= denominator;
    }
    [[nodiscard]] bool whole() const noexcept { return numerator == denominator; }

    /// "1/3".
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const SplitRatio&, const SplitRatio&) = default;
};

// ─── TransactionRecord ────────────────────────────────────────────────────────

/// Raw inputs for a record; validated by `TransactionRecord::make`.
struct TransactionFields {
    Date                       date{};
    std::string                description;
    double                     amount = 0.0;
    std::string                currency{constants::DEFAULT_CURRENCY};
    Category                   category;
    TransactionType            type = TransactionType::Expense;
    std::optional<std::string> person;
    std::optional<std::string> group;
    SplitRatio                 split{};
};

/// One immutable entry of financial history.
///
/// Construction only succeeds through `make`, which enforces:
/// - `amount` finite and > 0
/// - non-empty description and currency
/// - (main, sub) valid for `type` under the supplied taxonomy
/// - split ratio valid, and whole (1/1) unless `group` is set
/// - `person` and `group`, when present, non-empty
class TransactionRecord {
public:
    [[nodiscard]] static Result<TransactionRecord>
    make(TransactionFields fields, const CategoryTaxonomy& taxonomy);

    [[nodiscard]] Date date() const noexcept { return f_.date; }
    [[nodiscard]] const std::string& description() const noexcept { return f_.description; }
    [[nodiscard]] double amount() const noexcept { return f_.amount; }
    [[nodiscard]] const std::string& currency() const noexcept { return f_.currency; }
    [[nodiscard]] const Category& category() const noexcept { return f_.category; }
    [[nodiscard]] const std::string& main_category() const noexcept { return f_.category.main; }
    [[nodiscard]] const std::string& sub_category() const noexcept { return f_.category.sub; }
    [[nodiscard]] TransactionType type() const noexcept { return f_.type; }
    [[nodiscard]] const std::optional<std::string>& person() const noexcept { return f_.person; }
    [[nodiscard]] const std::optional<std::string>& group() const noexcept { return f_.group; }
    [[nodiscard]] SplitRatio split() const noexcept { return f_.split; }

    /// Read-only view of all fields.
    [[nodiscard]] const TransactionFields& fields() const noexcept { return f_; }

    /// One-line summary, e.g.
    /// "2024-03-01 expense 20.00 INR Food/panipuris 'panipuris'".
    [[nodiscard]] std::string to_string() const;

private:
    explicit TransactionRecord(TransactionFields fields) : f_(std::move(fields)) {}

    TransactionFields f_;
};

// ─── ParseError ───────────────────────────────────────────────────────────────

/// A clause the parser could not turn into a record.
struct ParseError {
    std::string clause;
    std::string reason;

    /// "<reason> (clause: '<clause>')".
    [[nodiscard]] std::string to_string() const;
};

}  // namespace finplan
