/// @file src/parser/transaction_parser.cpp
/// @brief Rule-based clause extraction: action, amount, item, counterparty,
///        date, group split.

#include "finplan/logging.hpp"
#include "finplan/parser.hpp"

#include "../core/text.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <exception>
#include <regex>
#include <stdexcept>
#include <string_view>

namespace finplan {

namespace {

// ─── Keyword tables ───────────────────────────────────────────────────────────

struct ActionKeyword {
    std::string_view verb;
    TransactionType  type;
};

constexpr std::array<ActionKeyword, 6> ACTIONS{{
    {"paid",     TransactionType::Expense},
    {"bought",   TransactionType::Expense},
    {"spent",    TransactionType::Expense},
    {"received", TransactionType::Income},
    {"earned",   TransactionType::Income},
    {"got",      TransactionType::Income},
}};

struct RelativeDate {
    std::string_view first;
    std::string_view second;  ///< Empty for one-word phrases
    int              offset_days;
};

/// Checked in this order; the first phrase present wins.
constexpr std::array<RelativeDate, 5> RELATIVE_DATES{{
    {"today",     "",     0},
    {"yesterday", "",    -1},
    {"tomorrow",  "",     1},
    {"last",      "week", -7},
    {"next",      "week",  7},
}};

struct GroupKeyword {
    std::string_view label;
    int              default_members;
};

constexpr std::array<GroupKeyword, 3> GROUPS{{
    {"common",  2},
    {"family",  3},
    {"friends", 4},
}};

struct CurrencyWord {
    std::string_view word;
    std::string_view code;
};

constexpr std::array<CurrencyWord, 10> CURRENCY_WORDS{{
    {"rupees", "INR"}, {"rupee", "INR"}, {"rs", "INR"}, {"inr", "INR"},
    {"dollars", "USD"}, {"dollar", "USD"}, {"usd", "USD"},
    {"euros", "EUR"}, {"euro", "EUR"}, {"eur", "EUR"},
}};

struct CurrencySymbol {
    std::string_view symbol;  ///< UTF-8
    std::string_view code;
};

constexpr std::array<CurrencySymbol, 3> CURRENCY_SYMBOLS{{
    {"\xE2\x82\xB9", "INR"},  // rupee sign
    {"$",            "USD"},
    {"\xE2\x82\xAC", "EUR"},  // euro sign
}};

constexpr std::array<std::string_view, 5> ITEM_PREPOSITIONS{"for", "on", "from", "of", "as"};
constexpr std::array<std::string_view, 5> ITEM_BOUNDARIES{"by", "for", "with", "from", "and"};
constexpr std::array<std::string_view, 4> COUNTERPARTY_MARKERS{"by", "from", "to", "with"};
constexpr std::array<std::string_view, 4> SPLIT_NOUNS{"people", "persons", "members", "person"};

/// Words skipped between a counterparty marker and the name.
constexpr std::array<std::string_view, 8> DETERMINERS{
    "a", "an", "the", "my", "our", "his", "her", "their"};

/// Never taken as a counterparty name.
constexpr std::array<std::string_view, 18> NOT_A_PERSON{
    "i", "we", "me", "my", "us", "you", "he", "she", "they", "him", "them", "it",
    "our", "cash", "card", "upi", "week", "and"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& table, std::string_view word) {
    return std::find(table.begin(), table.end(), word) != table.end();
}

std::optional<TransactionType> action_type(std::string_view word) {
    for (const auto& a : ACTIONS) {
        if (a.verb == word) return a.type;
    }
    return std::nullopt;
}

bool is_group_label(std::string_view word) {
    return std::any_of(GROUPS.begin(), GROUPS.end(),
                       [&](const GroupKeyword& g) { return g.label == word; });
}

bool is_relative_date_word(std::string_view word) {
    return std::any_of(RELATIVE_DATES.begin(), RELATIVE_DATES.end(),
                       [&](const RelativeDate& r) {
                           return r.first == word || (!r.second.empty() && r.second == word);
                       });
}

std::optional<std::string_view> currency_for_word(std::string_view word) {
    for (const auto& c : CURRENCY_WORDS) {
        if (c.word == word) return c.code;
    }
    return std::nullopt;
}

/// Tokens with trailing sentence punctuation removed; empty tokens dropped.
std::vector<std::string> tokenize(const std::string& clause) {
    std::vector<std::string> out;
    for (auto& tok : text::split_whitespace(clause)) {
        while (!tok.empty() && std::string_view(".,!?;:").find(tok.back()) != std::string_view::npos) {
            tok.pop_back();
        }
        if (!tok.empty()) out.push_back(std::move(tok));
    }
    return out;
}

template <typename Int>
bool to_int(std::string_view s, Int& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// ─── Dates ────────────────────────────────────────────────────────────────────

/// Absolute calendar date written as one token.
std::optional<Date> absolute_date(const std::string& token) {
    static const std::regex iso(R"(^(\d{4})-(\d{1,2})-(\d{1,2})$)");
    static const std::regex dmy(R"(^(\d{1,2})([-/])(\d{1,2})[-/](\d{4}|\d{2})$)");

    std::smatch m;
    int y = 0;
    unsigned a = 0, b = 0;
    if (std::regex_match(token, m, iso)) {
        if (!to_int(m.str(1), y) || !to_int(m.str(2), a) || !to_int(m.str(3), b)) {
            return std::nullopt;
        }
        return make_date(y, a, b);
    }
    if (!std::regex_match(token, m, dmy)) return std::nullopt;
    if (!to_int(m.str(1), a) || !to_int(m.str(3), b) || !to_int(m.str(4), y)) {
        return std::nullopt;
    }
    if (m.str(4).size() == 2) y += 2000;

    // '-' is always day-first; '/' is month-first unless the first field
    // cannot be a month.
    const bool day_first = m.str(2) == "-" || a > 12;
    return day_first ? make_date(y, b, a) : make_date(y, a, b);
}

struct DateMatch {
    Date                     date;
    std::vector<std::size_t> tokens;  ///< Positions consumed by the date
};

std::optional<DateMatch> find_date(const std::vector<std::string>& tokens, Date reference,
                                   bool absolute_enabled) {
    std::optional<DateMatch> relative;
    for (const auto& r : RELATIVE_DATES) {
        for (std::size_t i = 0; i < tokens.size() && !relative; ++i) {
            if (tokens[i] != r.first) continue;
            if (r.second.empty()) {
                relative = DateMatch{add_days(reference, r.offset_days), {i}};
            } else if (i + 1 < tokens.size() && tokens[i + 1] == r.second) {
                relative = DateMatch{add_days(reference, r.offset_days), {i, i + 1}};
            }
        }
        if (relative) break;
    }

    if (absolute_enabled) {
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (auto d = absolute_date(tokens[i])) {
                DateMatch match{*d, {i}};
                if (relative) {
                    match.tokens.insert(match.tokens.end(),
                                        relative->tokens.begin(), relative->tokens.end());
                }
                return match;
            }
        }
    }
    return relative;
}

// ─── Amount ───────────────────────────────────────────────────────────────────

struct AmountMatch {
    double                          value;
    std::optional<std::string_view> currency;
};

std::optional<AmountMatch> find_amount(const std::vector<std::string>& tokens) {
    // Digits with optional thousands separators, optional fraction, and an
    // optional attached currency word ("20rs").
    static const std::regex number(R"(^(\d{1,3}(?:,\d{3})+|\d+)(\.\d+)?([a-z]*)$)");

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        std::string_view tok = tokens[i];
        std::optional<std::string_view> currency;

        for (const auto& s : CURRENCY_SYMBOLS) {
            if (tok.substr(0, s.symbol.size()) == s.symbol) {
                currency = s.code;
                tok.remove_prefix(s.symbol.size());
                break;
            }
        }
        if (!currency && i > 0) {
            for (const auto& s : CURRENCY_SYMBOLS) {
                if (tokens[i - 1] == s.symbol) currency = s.code;
            }
        }

        std::match_results<std::string_view::const_iterator> m;
        if (!std::regex_match(tok.begin(), tok.end(), m, number)) continue;

        const std::string suffix = m.str(3);
        if (!suffix.empty()) {
            auto code = currency_for_word(suffix);
            if (!code) continue;
            currency = code;
        }
        if (!currency && i + 1 < tokens.size()) {
            currency = currency_for_word(tokens[i + 1]);
        }

        std::string digits = m.str(1) + m.str(2);
        digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            throw std::invalid_argument(fmt::format("Unreadable amount '{}'", tokens[i]));
        }
        return AmountMatch{value, currency};
    }
    return std::nullopt;
}

// ─── Item, counterparty, group ────────────────────────────────────────────────

/// Phrase after the first item preposition, up to the next boundary word.
/// `person` is the counterparty already taken from the clause, if any.
std::optional<std::string> find_item(const std::vector<std::string>& tokens,
                                     const std::optional<std::string>& person) {
    for (std::size_t p = 0; p < tokens.size(); ++p) {
        if (!contains(ITEM_PREPOSITIONS, tokens[p])) continue;

        std::size_t end = p + 1;
        while (end < tokens.size() && !contains(ITEM_BOUNDARIES, tokens[end])) ++end;
        if (end == p + 1) continue;

        // "from <name>" names the counterparty, not the item.
        if (tokens[p] == "from" && text::is_alpha(tokens[p + 1]) &&
            (end == p + 2 || (person && text::iequals(tokens[p + 1], *person)))) {
            continue;
        }

        return text::join(tokens, " ", p + 1, end);
    }
    return std::nullopt;
}

std::optional<std::string> find_counterparty(const std::vector<std::string>& tokens) {
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (!contains(COUNTERPARTY_MARKERS, tokens[i])) continue;
        std::size_t j = i + 1;
        while (j < tokens.size() && contains(DETERMINERS, tokens[j])) ++j;
        if (j >= tokens.size()) break;

        const std::string& name = tokens[j];
        if (!text::is_alpha(name) || is_group_label(name) ||
            contains(NOT_A_PERSON, name) || action_type(name) ||
            currency_for_word(name)) {
            continue;
        }
        return text::capitalize(name);
    }

    // Implied subject: "deepak paid 100 rupees for sabji".
    if (tokens.empty()) return std::nullopt;
    const std::string& lead = tokens.front();
    if (text::is_alpha(lead) && !contains(NOT_A_PERSON, lead) && !action_type(lead) &&
        !is_relative_date_word(lead) && !is_group_label(lead) && !currency_for_word(lead) &&
        !contains(DETERMINERS, lead) && !contains(ITEM_PREPOSITIONS, lead)) {
        return text::capitalize(lead);
    }
    return std::nullopt;
}

struct GroupMatch {
    std::string label;
    SplitRatio  split;
};

std::optional<GroupMatch> find_group(const std::vector<std::string>& tokens) {
    for (const auto& g : GROUPS) {
        if (std::find(tokens.begin(), tokens.end(), g.label) == tokens.end()) continue;

        int members = g.default_members;
        for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
            int n = 0;
            if (contains(SPLIT_NOUNS, tokens[i + 1]) && to_int(tokens[i], n) && n >= 1) {
                members = n;
                break;
            }
        }
        return GroupMatch{std::string(g.label), SplitRatio{1, members}};
    }
    return std::nullopt;
}

}  // namespace

// ─── Reports ──────────────────────────────────────────────────────────────────

std::string_view to_string(ParseStatus status) noexcept {
    switch (status) {
        case ParseStatus::Success: return "success";
        case ParseStatus::Partial: return "partial";
        case ParseStatus::Error:   return "error";
    }
    return "error";
}

std::string ParseReport::message() const {
    return transactions.empty() ? "No transactions processed" : "Transactions processed";
}

namespace {

ParseStatus status_of(const ParseReport& report) noexcept {
    if (report.errors.empty()) return ParseStatus::Success;
    return report.transactions.empty() ? ParseStatus::Error : ParseStatus::Partial;
}

}  // namespace

// ─── TransactionParser ────────────────────────────────────────────────────────

TransactionParser::TransactionParser(std::shared_ptr<const CategoryTaxonomy> taxonomy,
                                     ParserConfig config)
    : taxonomy_(std::move(taxonomy))
    , classifier_(taxonomy_)
    , config_(std::move(config))
{
    if (config_.default_currency.empty()) {
        config_.default_currency = std::string(constants::DEFAULT_CURRENCY);
    }
}

std::pair<ParseEntry, TransactionParser::ClauseCarry>
TransactionParser::parse_clause(const std::string& clause, const ClauseCarry& carry,
                                Date reference) const {
    ClauseCarry next = carry;
    try {
        std::vector<std::string> tokens = tokenize(clause);

        // Step 1: date, and remove its tokens.
        Date date = reference;
        if (auto d = find_date(tokens, reference, config_.recognize_absolute_dates)) {
            date = d->date;
            std::sort(d->tokens.rbegin(), d->tokens.rend());
            for (std::size_t pos : d->tokens) {
                tokens.erase(tokens.begin() + static_cast<std::ptrdiff_t>(pos));
                // "on 15-11-2023": the preposition belongs to the date.
                if (pos > 0 && tokens[pos - 1] == "on") {
                    tokens.erase(tokens.begin() + static_cast<std::ptrdiff_t>(pos - 1));
                }
            }
        }

        // Step 2: action verb, own or carried.
        std::optional<std::size_t> action_pos;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (action_type(tokens[i])) {
                action_pos = i;
                next.action = tokens[i];
                break;
            }
        }
        if (!next.action) {
            return {ParseError{clause, "No action found"}, next};
        }
        const TransactionType type = *action_type(*next.action);

        // Step 3: amount.
        const auto amount = find_amount(tokens);
        if (!amount) {
            return {ParseError{clause, "No amount found"}, next};
        }
        if (amount->value <= 0.0) {
            return {ParseError{clause, "Amount must be positive"}, next};
        }

        // Step 4: counterparty, then the item and its category.
        TransactionFields fields;
        fields.date   = date;
        fields.type   = type;
        fields.amount = amount->value;
        fields.currency = amount->currency ? std::string(*amount->currency)
                                           : config_.default_currency;

        fields.person = find_counterparty(tokens);
        if (auto item = find_item(tokens, fields.person)) {
            fields.category    = classifier_.classify(*item, type);
            fields.description = std::move(*item);
        } else {
            const std::size_t from =
                (action_pos && *action_pos + 1 < tokens.size()) ? *action_pos + 1 : 0;
            fields.description = text::join(tokens, " ", from);
            fields.category    = classifier_.fallback(type);
        }

        // Step 5: group split.
        if (auto group = find_group(tokens)) {
            fields.group = std::move(group->label);
            fields.split = group->split;
        }

        auto record = TransactionRecord::make(std::move(fields), *taxonomy_);
        if (!record) {
            return {ParseError{clause, record.error()}, next};
        }
        logging::logger()->debug("Parsed transaction: {}", record->to_string());
        return {std::move(record).value(), next};
    } catch (const std::exception& e) {
        logging::logger()->warn("Transaction parsing error in '{}': {}", clause, e.what());
        return {ParseError{clause, e.what()}, next};
    }
}

std::vector<ParseEntry> TransactionParser::parse(std::string_view utterance) const {
    logging::logger()->debug("Parsing input: {}", utterance);

    const std::string normalized = text::collapse_whitespace(text::to_lower(utterance));
    const Date reference = config_.reference_date.value_or(today());

    std::vector<ParseEntry> entries;
    ClauseCarry carry;
    for (const auto& part : text::split(normalized, " and ")) {
        const std::string clause(text::trim(part));
        auto [entry, next] = parse_clause(clause, carry, reference);
        if (const auto* err = std::get_if<ParseError>(&entry)) {
            logging::logger()->debug("Clause rejected: {}", err->to_string());
        }
        entries.push_back(std::move(entry));
        carry = std::move(next);
    }
    return entries;
}

ParseReport TransactionParser::summarize(const std::vector<ParseEntry>& entries) {
    ParseReport report;
    for (const auto& entry : entries) {
        if (const auto* rec = std::get_if<TransactionRecord>(&entry)) {
            report.transactions.push_back(*rec);
        } else {
            report.errors.push_back(std::get<ParseError>(entry).to_string());
        }
    }
    report.status = status_of(report);
    return report;
}

ParseReport TransactionParser::process(std::string_view utterance,
                                       storage::TransactionStore& store) const {
    ParseReport report;
    for (auto& entry : parse(utterance)) {
        if (auto* rec = std::get_if<TransactionRecord>(&entry)) {
            if (auto st = store.add_transaction(*rec); !st) {
                report.errors.push_back(
                    fmt::format("Could not store '{}': {}", rec->description(), st.reason()));
                continue;
            }
            report.transactions.push_back(std::move(*rec));
        } else {
            report.errors.push_back(std::get<ParseError>(entry).to_string());
        }
    }
    report.status = status_of(report);
    logging::logger()->debug("Processed '{}': {} stored, {} errors ({})", utterance,
                             report.transactions.size(), report.errors.size(),
                             to_string(report.status));
    return report;
}

}  // namespace finplan
