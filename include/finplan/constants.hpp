#pragma once

#include <cstddef>
#include <string_view>

/// @file include/finplan/constants.hpp
/// @brief Shared numeric and textual defaults for the finplan engine.
///
/// Every configuration struct defaults its members from this file, so a
/// tuning change is made here once.

namespace finplan::constants {

// ─── Records ──────────────────────────────────────────────────────────────────

/// Currency assigned when the input names none.
static constexpr std::string_view DEFAULT_CURRENCY = "INR";

// ─── Classifier ───────────────────────────────────────────────────────────────

/// Minimum weighted-ratio score for a whole-description match.
static constexpr int PHRASE_MATCH_THRESHOLD = 80;

/// Minimum weighted-ratio score for a single-word match.
static constexpr int WORD_MATCH_THRESHOLD = 85;

/// Tokens shorter than this never take part in word-level matching.
static constexpr std::size_t MIN_MATCH_TOKEN_LENGTH = 3;

// ─── Budget Forecaster ────────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_FORECAST_WINDOW = 3;
static constexpr double DEFAULT_CONFIDENCE_LEVEL = 0.95;

// ─── Debt Optimizer ───────────────────────────────────────────────────────────

/// Simulation stops with an error once this many months have elapsed with
/// balance still outstanding.
static constexpr std::size_t MAX_PAYOFF_MONTHS = 1000;

static constexpr double MONTHS_PER_YEAR = 12.0;

// ─── Savings Optimizer ────────────────────────────────────────────────────────

static constexpr double DEFAULT_ANNUAL_RETURN = 0.07;
static constexpr double DEFAULT_ANNUAL_VOLATILITY = 0.15;
static constexpr std::size_t MONTE_CARLO_TRIALS = 1000;

/// Longest savings horizon simulated (100 years).
static constexpr std::size_t MAX_SAVINGS_MONTHS = 1200;

/// Share of monthly income that can be set aside without strain.
static constexpr double AFFORDABLE_INCOME_FRACTION = 0.3;

/// Success probability below which the plan should be reconsidered.
static constexpr double RECONSIDER_THRESHOLD = 0.7;

// ─── Emergency Fund Advisor ───────────────────────────────────────────────────

static constexpr double EMERGENCY_MIN_MONTHS = 3.0;
static constexpr double EMERGENCY_MAX_MONTHS = 6.0;
static constexpr double VARIABLE_INCOME_LOADING = 0.2;
static constexpr double PER_DEPENDENT_LOADING = 0.1;

/// Stddev assumed, as a fraction of the mean, when the sample has none.
static constexpr double FALLBACK_STDDEV_FRACTION = 0.1;

}  // namespace finplan::constants
