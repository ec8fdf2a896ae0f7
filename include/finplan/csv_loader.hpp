#pragma once

/// @file include/finplan/csv_loader.hpp
/// @brief CSV import of transaction history and debt lists.
///
/// # Module: CsvLoader
///
/// ## Responsibility
/// Turn CSV text into `TransactionRecord`s (validated against a taxonomy) or
/// `advisors::Debt`s. Malformed rows are skipped and counted; the loader
/// never fails a whole file because of one bad line.
///
/// ## Expected CSV Formats
/// Transactions:
/// ```
/// date,description,amount,type,main_category,sub_category[,currency,person,group,split]
/// 2024-03-01,panipuris,20,expense,Food,panipuris
/// 2024-03-02,dinner,900,expense,Food,dining out,INR,Asha,friends,1/4
/// ```
/// Debts:
/// ```
/// balance,rate,min_payment[,label]
/// 10000,0.18,200,credit card
/// ```
/// The first non-comment line is the header. Lines starting with `#` and
/// blank lines are ignored. Fields are separated by plain commas (no
/// quoting). `split` is `a/b` or a decimal in (0, 1].
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Does not modify any file or external state

#include "finplan/debt.hpp"
#include "finplan/taxonomy.hpp"
#include "finplan/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finplan::core {

/// Parsed rows plus the number of data rows that were rejected.
template <typename Row>
struct LoadResult {
    std::vector<Row> rows;
    std::size_t      skipped = 0;
};

class CsvLoader {
public:
    explicit CsvLoader(std::shared_ptr<const CategoryTaxonomy> taxonomy);

    [[nodiscard]] std::optional<LoadResult<TransactionRecord>>
    load_transactions(const std::string& filepath) const noexcept;

    [[nodiscard]] LoadResult<TransactionRecord>
    parse_transactions(const std::string& csv_content) const noexcept;

    [[nodiscard]] static std::optional<LoadResult<advisors::Debt>>
    load_debts(const std::string& filepath) noexcept;

    [[nodiscard]] static LoadResult<advisors::Debt>
    parse_debts(const std::string& csv_content) noexcept;

    /// `a/b` or a decimal in (0, 1]; `nullopt` otherwise.
    [[nodiscard]] static std::optional<SplitRatio> parse_split(std::string_view field) noexcept;

private:
    [[nodiscard]] std::optional<TransactionRecord>
    parse_transaction_row(const std::string& line) const;

    [[nodiscard]] static std::optional<advisors::Debt>
    parse_debt_row(const std::string& line);

    std::shared_ptr<const CategoryTaxonomy> taxonomy_;
};

}  // namespace finplan::core
