#pragma once

/// @file include/finplan/storage.hpp
/// @brief Persistence contract for transaction history, plus an in-memory
///        reference store.
///
/// # Module: Storage
///
/// ## Responsibility
/// `TransactionStore` is the only surface the engine needs from a storage
/// engine: append one record, fetch a filtered history. Real backends live
/// outside this repository and implement the interface.
///
/// `InMemoryTransactionStore` implements the contract for the CLI and the
/// tests, and adds the roll-ups a ledger usually keeps next to the raw
/// history: per-category monthly budgets, per-counterparty balances, a bulk
/// insert that skips duplicates, and a current-month spending summary.
///
/// ## Guarantees
/// - `fetch_transactions` returns the most recent records first
/// - `InMemoryTransactionStore` is safe to share between threads
///
/// ## NOT Responsible For
/// - Durability (everything is lost with the process)
/// - Currency conversion (amounts of different currencies are summed as-is)

#include "finplan/result.hpp"
#include "finplan/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace finplan::storage {

// ─── Contract ─────────────────────────────────────────────────────────────────

struct TransactionFilter {
    /// Keep records dated no earlier than `days_back` days before today.
    std::optional<int> days_back;
    std::optional<TransactionType> type;
};

class TransactionStore {
public:
    virtual ~TransactionStore() = default;

    /// Append one record. Storage faults and rejected records are reported
    /// through the returned status.
    [[nodiscard]] virtual Status add_transaction(const TransactionRecord& record) = 0;

    /// Records matching `filter`, most recent first.
    [[nodiscard]] virtual std::vector<TransactionRecord>
    fetch_transactions(const TransactionFilter& filter = TransactionFilter{}) const = 0;
};

// ─── In-memory store ──────────────────────────────────────────────────────────

/// Monthly spending limit for one main expense category.
struct Budget {
    double           monthly_limit    = 0.0;
    double           current_spending = 0.0;
    std::chrono::year_month period{};  ///< Month `current_spending` belongs to

    /// `monthly_limit - current_spending`; negative when over budget.
    [[nodiscard]] double remaining() const noexcept { return monthly_limit - current_spending; }
};

class InMemoryTransactionStore final : public TransactionStore {
public:
    /// Source of "today"; replaceable so tests can pin the calendar.
    using Clock = std::function<Date()>;

    explicit InMemoryTransactionStore(Clock clock = &finplan::today);

    [[nodiscard]] Status add_transaction(const TransactionRecord& record) override;

    [[nodiscard]] std::vector<TransactionRecord>
    fetch_transactions(const TransactionFilter& filter = TransactionFilter{}) const override;

    /// Insert every record whose (date, description, amount) is not already
    /// stored or earlier in the batch.
    ///
    /// # Returns
    /// Number of records inserted; error if any record is rejected, in which
    /// case nothing is inserted.
    [[nodiscard]] Result<std::size_t> add_transactions(std::span<const TransactionRecord> records);

    /// Set (or create) the monthly limit for a main expense category.
    [[nodiscard]] Status set_budget_limit(const std::string& main_category, double limit);

    /// Budgets keyed by main category, rolled over to the current month.
    [[nodiscard]] std::map<std::string, Budget> budgets() const;

    /// Net amount per counterparty: expenses add (they owe us), income
    /// subtracts.
    [[nodiscard]] std::map<std::string, double> person_balances() const;

    /// Expense totals per main category for the current calendar month.
    [[nodiscard]] std::map<std::string, double> spending_summary() const;

    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] static Status validate(const TransactionRecord& record);
    void insert_locked(const TransactionRecord& record);
    static void roll_over(Budget& budget, std::chrono::year_month now) noexcept;

    Clock                           clock_;
    mutable std::mutex              mutex_;
    std::vector<TransactionRecord>  records_;
    std::map<std::string, Budget>   budgets_;
    std::map<std::string, double>   balances_;
};

}  // namespace finplan::storage
