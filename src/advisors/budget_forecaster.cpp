/// @file src/advisors/budget_forecaster.cpp
/// @brief Moving-average monthly spending forecast with a normal interval.

#include "finplan/forecast.hpp"
#include "finplan/logging.hpp"

#include "statistics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <vector>

namespace finplan::advisors {

std::string ForecastReport::to_string() const {
    std::string out = fmt::format("prediction={:.2f} method='{}' confidence={:.2f} months={}",
                                  prediction, method, confidence_level, months_observed);
    if (interval) {
        out += fmt::format(" interval=[{:.2f}, {:.2f}]", interval->lower, interval->upper);
    }
    return out;
}

Result<ForecastReport>
BudgetForecaster::forecast(std::span<const TransactionRecord> history) const {
    return forecast(history, config_.window_size, config_.confidence_level);
}

Result<ForecastReport>
BudgetForecaster::forecast_spending(std::span<const TransactionRecord> history,
                                    std::size_t window_size, double confidence_level) {
    std::vector<TransactionRecord> expenses;
    std::copy_if(history.begin(), history.end(), std::back_inserter(expenses),
                 [](const TransactionRecord& r) { return r.type() == TransactionType::Expense; });
    logging::logger()->debug("Forecasting {} expense records of {}",
                             expenses.size(), history.size());
    return forecast(expenses, window_size, confidence_level);
}

Result<ForecastReport>
BudgetForecaster::forecast(std::span<const TransactionRecord> history,
                           std::size_t window_size, double confidence_level) {
    auto& log = *logging::logger();

    if (history.empty()) {
        log.warn("No valid historical data for forecasting");
        return Result<ForecastReport>::failure("No valid historical data available");
    }
    for (const auto& r : history) {
        if (!std::isfinite(r.amount()) || r.amount() <= 0.0) {
            return Result<ForecastReport>::failure(
                fmt::format("Malformed amount in history: {}", r.amount()));
        }
    }
    if (window_size == 0) {
        return Result<ForecastReport>::failure("Window size must be at least 1");
    }
    if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
        return Result<ForecastReport>::failure("Confidence level must lie in (0, 1)");
    }

    const std::vector<double> monthly = stats::monthly_totals(history);

    ForecastReport report;
    report.confidence_level = confidence_level;
    report.months_observed  = monthly.size();

    if (monthly.size() < window_size) {
        report.prediction = stats::round_to_cents(stats::mean(monthly));
        report.method     = fmt::format("{}-month moving average (insufficient data)", window_size);
        report.degraded   = true;
        log.debug("Insufficient data ({} months), using mean: {:.2f}",
                  monthly.size(), report.prediction);
        return report;
    }

    const std::span<const double> window(monthly.data() + monthly.size() - window_size,
                                         window_size);
    const double m = stats::mean(window);
    const double s = stats::sample_stddev(window).value_or(0.0);
    const double z = stats::inverse_normal_cdf(1.0 - (1.0 - confidence_level) / 2.0);

    report.prediction = stats::round_to_cents(m);
    report.interval   = ConfidenceInterval{stats::round_to_cents(m - z * s),
                                           stats::round_to_cents(m + z * s)};
    report.method     = fmt::format("{}-month moving average", window_size);
    log.debug("Forecast result: {}", report.to_string());
    return report;
}

}  // namespace finplan::advisors
