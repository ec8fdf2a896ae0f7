/// @file src/core/transaction_record.cpp
/// @brief TransactionRecord validation and shared value-type helpers.

#include "finplan/types.hpp"
#include "finplan/taxonomy.hpp"

#include "text.hpp"

#include <fmt/format.h>

#include <cmath>

namespace finplan {

// ─── TransactionType ──────────────────────────────────────────────────────────

std::string_view to_string(TransactionType type) noexcept {
    return type == TransactionType::Income ? "income" : "expense";
}

std::optional<TransactionType> parse_transaction_type(std::string_view label) noexcept {
    const std::string_view t = text::trim(label);
    if (text::iequals(t, "income"))  return TransactionType::Income;
    if (text::iequals(t, "expense")) return TransactionType::Expense;
    return std::nullopt;
}

// ─── SplitRatio ───────────────────────────────────────────────────────────────

std::string SplitRatio::to_string() const {
    return fmt::format("{}/{}", numerator, denominator);
}

// ─── TransactionRecord ────────────────────────────────────────────────────────

Result<TransactionRecord>
TransactionRecord::make(TransactionFields fields, const CategoryTaxonomy& taxonomy) {
    using Out = Result<TransactionRecord>;

    if (!fields.date.ok()) {
        return Out::failure("Missing required field: date");
    }
    fields.description = std::string(text::trim(fields.description));
    if (fields.description.empty()) {
        return Out::failure("Missing required field: description");
    }
    if (!std::isfinite(fields.amount) || fields.amount <= 0.0) {
        return Out::failure("Amount must be a positive number");
    }
    fields.currency = std::string(text::trim(fields.currency));
    if (fields.currency.empty()) {
        return Out::failure("Missing required field: currency");
    }
    if (fields.category.main.empty() || fields.category.sub.empty()) {
        return Out::failure("Missing required field: category");
    }

    auto canonical = taxonomy.canonical(fields.type, fields.category.main,
                                        fields.category.sub);
    if (!canonical) {
        return Out::failure(fmt::format("Invalid {} category: {}/{}",
                                        finplan::to_string(fields.type),
                                        fields.category.main, fields.category.sub));
    }
    fields.category = std::move(*canonical);

    if (fields.person && text::trim(*fields.person).empty()) {
        return Out::failure("Person label must not be empty");
    }
    if (fields.group && text::trim(*fields.group).empty()) {
        return Out::failure("Group label must not be empty");
    }
    if (!fields.split.valid()) {
        return Out::failure(fmt::format("Invalid split ratio {}", fields.split.to_string()));
    }
    if (!fields.group && !fields.split.whole()) {
        return Out::failure("Split ratio requires a group");
    }

    return TransactionRecord(std::move(fields));
}

std::string TransactionRecord::to_string() const {
    std::string out = fmt::format("{} {} {:.2f} {} {}/{} '{}'",
                                  to_iso(f_.date), finplan::to_string(f_.type),
                                  f_.amount, f_.currency,
                                  f_.category.main, f_.category.sub, f_.description);
    if (f_.person) out += fmt::format(" person={}", *f_.person);
    if (f_.group)  out += fmt::format(" group={} split={}", *f_.group, f_.split.to_string());
    return out;
}

// ─── ParseError ───────────────────────────────────────────────────────────────

std::string ParseError::to_string() const {
    return fmt::format("{} (clause: '{}')", reason, clause);
}

}  // namespace finplan
