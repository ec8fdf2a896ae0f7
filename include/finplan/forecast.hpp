#pragma once

/// @file include/finplan/forecast.hpp
/// @brief BudgetForecaster — next-month spending from a trailing moving average.
///
/// # Module: Budget Forecaster
///
/// ## Method
/// Amounts are bucketed into calendar months, from the first month of the
/// history to the last, with empty months counted as 0. With at least
/// `window` months, the prediction is the mean of the last `window` months
/// and the interval is
///
///     mean ± z · s,   z = Φ⁻¹(1 − (1 − c) / 2)
///
/// where `s` is the sample standard deviation of the same window (0 for a
/// window of one month) and `c` the confidence level. With fewer months the
/// prediction is the plain mean of every month and no interval is given.
///
/// All reported values are rounded to cents.
///
/// ## NOT Responsible For
/// - Choosing which records to forecast (the caller filters by type/period;
///   `forecast_spending` is the expense-only convenience)

#include "finplan/constants.hpp"
#include "finplan/result.hpp"
#include "finplan/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace finplan::advisors {

struct ForecastConfig {
    std::size_t window_size      = constants::DEFAULT_FORECAST_WINDOW;
    double      confidence_level = constants::DEFAULT_CONFIDENCE_LEVEL;
};

struct ConfidenceInterval {
    double lower;
    double upper;
};

struct ForecastReport {
    double                            prediction = 0.0;
    std::optional<ConfidenceInterval> interval;  ///< Unset when degraded
    std::string                       method;
    double                            confidence_level = 0.0;
    bool                              degraded = false;
    std::size_t                       months_observed = 0;

    [[nodiscard]] std::string to_string() const;
};

class BudgetForecaster {
public:
    explicit BudgetForecaster(ForecastConfig config = ForecastConfig{}) : config_(config) {}

    /// Forecast with the configured window and confidence level.
    [[nodiscard]] Result<ForecastReport>
    forecast(std::span<const TransactionRecord> history) const;

    /// # Errors
    /// Empty history, a non-finite or non-positive amount, `window_size` 0,
    /// or `confidence_level` outside (0, 1).
    [[nodiscard]] static Result<ForecastReport>
    forecast(std::span<const TransactionRecord> history,
             std::size_t window_size, double confidence_level);

    /// `forecast` over the expense records of a mixed history.
    [[nodiscard]] static Result<ForecastReport>
    forecast_spending(std::span<const TransactionRecord> history,
                      std::size_t window_size, double confidence_level);

    [[nodiscard]] const ForecastConfig& config() const noexcept { return config_; }

private:
    ForecastConfig config_;
};

}  // namespace finplan::advisors
