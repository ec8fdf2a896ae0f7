/// @file src/core/csv_loader.cpp
/// @brief CSV loader for transaction history and debt lists.

#include "finplan/csv_loader.hpp"
#include "finplan/logging.hpp"

#include "text.hpp"

#include <charconv>
#include <cmath>
#include <exception>
#include <fstream>
#include <numeric>
#include <sstream>

namespace finplan::core {

namespace {

constexpr std::size_t TRANSACTION_MIN_FIELDS = 6;
constexpr std::size_t TRANSACTION_MAX_FIELDS = 10;
constexpr std::size_t DEBT_MIN_FIELDS = 3;
constexpr std::size_t DEBT_MAX_FIELDS = 4;

/// Largest denominator used when converting a decimal split.
constexpr int SPLIT_DECIMAL_SCALE = 1000;

std::optional<double> parse_double(std::string_view s) noexcept {
    double val = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(val)) {
        return std::nullopt;
    }
    return val;
}

/// Comma-split with every field trimmed.
std::vector<std::string> fields_of(const std::string& line) {
    std::vector<std::string> out;
    for (const auto& f : text::split(line, ",")) out.emplace_back(text::trim(f));
    return out;
}

/// Feed each data line (header, comments and blanks removed) to `on_row`.
template <typename OnRow>
void for_each_row(const std::string& csv_content, OnRow&& on_row) {
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const auto trimmed = text::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        on_row(line);
    }
}

std::optional<std::string> read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

}  // namespace

CsvLoader::CsvLoader(std::shared_ptr<const CategoryTaxonomy> taxonomy)
    : taxonomy_(std::move(taxonomy))
{
    if (!taxonomy_) taxonomy_ = CategoryTaxonomy::standard();
}

// ─── CsvLoader::parse_split ───────────────────────────────────────────────────

std::optional<SplitRatio> CsvLoader::parse_split(std::string_view field) noexcept {
    field = text::trim(field);
    if (field.empty()) return SplitRatio{};

    if (const auto slash = field.find('/'); slash != std::string_view::npos) {
        int num = 0, den = 0;
        const auto a = field.substr(0, slash);
        const auto b = field.substr(slash + 1);
        auto ra = std::from_chars(a.data(), a.data() + a.size(), num);
        auto rb = std::from_chars(b.data(), b.data() + b.size(), den);
        if (ra.ec != std::errc{} || ra.ptr != a.data() + a.size() ||
            rb.ec != std::errc{} || rb.ptr != b.data() + b.size()) {
            return std::nullopt;
        }
        const SplitRatio split{num, den};
        if (!split.valid()) return std::nullopt;
        return split;
    }

    const auto value = parse_double(field);
    if (!value || *value <= 0.0 || *value > 1.0) return std::nullopt;

    // Prefer 1/n when the decimal is a unit fraction ("0.25" -> 1/4).
    const double inverse = 1.0 / *value;
    const double n = std::round(inverse);
    if (std::abs(inverse - n) < 1e-6 && n <= SPLIT_DECIMAL_SCALE) {
        return SplitRatio{1, static_cast<int>(n)};
    }
    const int num = static_cast<int>(std::lround(*value * SPLIT_DECIMAL_SCALE));
    if (num <= 0) return std::nullopt;
    const int g = std::gcd(num, SPLIT_DECIMAL_SCALE);
    return SplitRatio{num / g, SPLIT_DECIMAL_SCALE / g};
}

// ─── Transactions ─────────────────────────────────────────────────────────────

std::optional<TransactionRecord>
CsvLoader::parse_transaction_row(const std::string& line) const {
    const auto f = fields_of(line);
    if (f.size() < TRANSACTION_MIN_FIELDS || f.size() > TRANSACTION_MAX_FIELDS) {
        return std::nullopt;
    }

    const auto date   = parse_iso(f[0]);
    const auto amount = parse_double(f[2]);
    const auto type   = parse_transaction_type(f[3]);
    if (!date || !amount || !type) return std::nullopt;

    TransactionFields fields;
    fields.date        = *date;
    fields.description = f[1];
    fields.amount      = *amount;
    fields.type        = *type;
    fields.category    = Category{f[4], f[5]};
    if (f.size() > 6 && !f[6].empty()) fields.currency = f[6];
    if (f.size() > 7 && !f[7].empty()) fields.person = f[7];
    if (f.size() > 8 && !f[8].empty()) fields.group = f[8];
    if (f.size() > 9) {
        const auto split = parse_split(f[9]);
        if (!split) return std::nullopt;
        fields.split = *split;
    }

    auto record = TransactionRecord::make(std::move(fields), *taxonomy_);
    if (!record) {
        logging::logger()->debug("Skipping CSV row '{}': {}", line, record.error());
        return std::nullopt;
    }
    return std::move(record).value();
}

LoadResult<TransactionRecord>
CsvLoader::parse_transactions(const std::string& csv_content) const noexcept {
    LoadResult<TransactionRecord> result;
    try {
        for_each_row(csv_content, [&](const std::string& line) {
            if (auto record = parse_transaction_row(line)) {
                result.rows.push_back(std::move(*record));
            } else {
                ++result.skipped;
            }
        });
    } catch (const std::exception& e) {
        logging::logger()->error("Transaction CSV parsing stopped: {}", e.what());
    }
    if (result.skipped > 0) {
        logging::logger()->warn("Skipped {} malformed transaction rows", result.skipped);
    }
    return result;
}

std::optional<LoadResult<TransactionRecord>>
CsvLoader::load_transactions(const std::string& filepath) const noexcept {
    try {
        const auto contents = read_file(filepath);
        if (!contents) {
            logging::logger()->error("Cannot open transaction file '{}'", filepath);
            return std::nullopt;
        }
        return parse_transactions(*contents);
    } catch (const std::exception& e) {
        logging::logger()->error("Cannot read transaction file '{}': {}", filepath, e.what());
        return std::nullopt;
    }
}

// ─── Debts ────────────────────────────────────────────────────────────────────

std::optional<advisors::Debt> CsvLoader::parse_debt_row(const std::string& line) {
    const auto f = fields_of(line);
    if (f.size() < DEBT_MIN_FIELDS || f.size() > DEBT_MAX_FIELDS) return std::nullopt;

    const auto balance = parse_double(f[0]);
    const auto rate    = parse_double(f[1]);
    const auto payment = parse_double(f[2]);
    if (!balance || !rate || !payment) return std::nullopt;
    if (*balance < 0.0 || *rate < 0.0 || *payment < 0.0) return std::nullopt;

    return advisors::Debt{*balance, *rate, *payment, f.size() > 3 ? f[3] : std::string{}};
}

LoadResult<advisors::Debt> CsvLoader::parse_debts(const std::string& csv_content) noexcept {
    LoadResult<advisors::Debt> result;
    try {
        for_each_row(csv_content, [&](const std::string& line) {
            if (auto debt = parse_debt_row(line)) {
                result.rows.push_back(std::move(*debt));
            } else {
                ++result.skipped;
            }
        });
    } catch (const std::exception& e) {
        logging::logger()->error("Debt CSV parsing stopped: {}", e.what());
    }
    if (result.skipped > 0) {
        logging::logger()->warn("Skipped {} malformed debt rows", result.skipped);
    }
    return result;
}

std::optional<LoadResult<advisors::Debt>>
CsvLoader::load_debts(const std::string& filepath) noexcept {
    try {
        const auto contents = read_file(filepath);
        if (!contents) {
            logging::logger()->error("Cannot open debt file '{}'", filepath);
            return std::nullopt;
        }
        return parse_debts(*contents);
    } catch (const std::exception& e) {
        logging::logger()->error("Cannot read debt file '{}': {}", filepath, e.what());
        return std::nullopt;
    }
}

}  // namespace finplan::core
