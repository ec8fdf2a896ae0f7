/// @file src/storage/memory_store.cpp
/// @brief Mutex-guarded in-memory TransactionStore with ledger roll-ups.

#include "finplan/logging.hpp"
#include "finplan/storage.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>

namespace finplan::storage {

namespace {

std::chrono::year_month month_of(Date d) noexcept {
    return std::chrono::year_month{d.year(), d.month()};
}

/// Identity used to detect duplicate inserts.
using DedupKey = std::tuple<int, std::string, double>;

DedupKey dedup_key(const TransactionRecord& r) {
    const auto days = std::chrono::sys_days{r.date()}.time_since_epoch().count();
    return {static_cast<int>(days), r.description(), r.amount()};
}

}  // namespace

InMemoryTransactionStore::InMemoryTransactionStore(Clock clock)
    : clock_(std::move(clock))
{
    if (!clock_) clock_ = &finplan::today;
}

// ─── Writes ───────────────────────────────────────────────────────────────────

Status InMemoryTransactionStore::validate(const TransactionRecord& record) {
    if (!std::isfinite(record.amount()) || record.amount() <= 0.0) {
        return Status::failure("Amount must be a positive number");
    }
    if (record.description().empty()) {
        return Status::failure("Missing required field: description");
    }
    if (record.main_category().empty() || record.sub_category().empty()) {
        return Status::failure("Missing required field: category");
    }
    return Status::success();
}

void InMemoryTransactionStore::roll_over(Budget& budget, std::chrono::year_month now) noexcept {
    if (budget.period < now) {
        budget.current_spending = 0.0;
        budget.period = now;
    }
}

void InMemoryTransactionStore::insert_locked(const TransactionRecord& record) {
    records_.push_back(record);

    if (record.type() == TransactionType::Expense) {
        const auto now = month_of(clock_());
        auto [it, created] = budgets_.try_emplace(record.main_category(), Budget{0.0, 0.0, now});
        roll_over(it->second, now);
        if (month_of(record.date()) == it->second.period) {
            it->second.current_spending += record.amount();
        }
    }

    if (record.person()) {
        const double sign = record.type() == TransactionType::Expense ? 1.0 : -1.0;
        balances_[*record.person()] += sign * record.amount();
    }
}

Status InMemoryTransactionStore::add_transaction(const TransactionRecord& record) {
    if (auto st = validate(record); !st) {
        logging::logger()->warn("Rejected transaction '{}': {}",
                                record.description(), st.reason());
        return st;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(record);
    logging::logger()->debug("Transaction added: {}", record.to_string());
    return Status::success();
}

Result<std::size_t>
InMemoryTransactionStore::add_transactions(std::span<const TransactionRecord> records) {
    for (const auto& r : records) {
        if (auto st = validate(r); !st) {
            logging::logger()->warn("Rejected batch at '{}': {}", r.description(), st.reason());
            return Result<std::size_t>::failure(st.reason());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::set<DedupKey> seen;
    for (const auto& r : records_) seen.insert(dedup_key(r));

    std::size_t inserted = 0;
    for (const auto& r : records) {
        if (!seen.insert(dedup_key(r)).second) continue;
        insert_locked(r);
        ++inserted;
    }
    logging::logger()->debug("Bulk insert: {} of {} records added", inserted, records.size());
    return inserted;
}

Status InMemoryTransactionStore::set_budget_limit(const std::string& main_category,
                                                  double limit) {
    if (main_category.empty()) return Status::failure("Budget category must not be empty");
    if (!std::isfinite(limit) || limit < 0.0) {
        return Status::failure("Budget limit must be a non-negative number");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = month_of(clock_());
    auto [it, created] = budgets_.try_emplace(main_category, Budget{0.0, 0.0, now});
    roll_over(it->second, now);
    it->second.monthly_limit = limit;
    return Status::success();
}

// ─── Reads ────────────────────────────────────────────────────────────────────

std::vector<TransactionRecord>
InMemoryTransactionStore::fetch_transactions(const TransactionFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<Date> cutoff;
    if (filter.days_back) cutoff = add_days(clock_(), -*filter.days_back);

    std::vector<TransactionRecord> out;
    for (const auto& r : records_) {
        if (filter.type && r.type() != *filter.type) continue;
        if (cutoff && r.date() < *cutoff) continue;
        out.push_back(r);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const TransactionRecord& a, const TransactionRecord& b) {
                         return a.date() > b.date();
                     });
    return out;
}

std::map<std::string, Budget> InMemoryTransactionStore::budgets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = month_of(clock_());
    auto out = budgets_;
    for (auto& [category, budget] : out) roll_over(budget, now);
    return out;
}

std::map<std::string, double> InMemoryTransactionStore::person_balances() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_;
}

std::map<std::string, double> InMemoryTransactionStore::spending_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = month_of(clock_());
    std::map<std::string, double> out;
    for (const auto& r : records_) {
        if (r.type() == TransactionType::Expense && month_of(r.date()) == now) {
            out[r.main_category()] += r.amount();
        }
    }
    return out;
}

std::size_t InMemoryTransactionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace finplan::storage
