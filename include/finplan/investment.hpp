#pragma once

/// @file include/finplan/investment.hpp
/// @brief InvestmentAdvisor — rule-based asset allocation by risk profile and
///        horizon.
///
/// Base allocations (stocks / bonds / gold / cash, percent):
///   conservative 30 / 50 / 15 / 5
///   moderate     50 / 35 / 10 / 5
///   aggressive   70 / 20 /  5 / 5
///
/// Horizons above 10 years shift 10 points from bonds to stocks; horizons
/// below 3 years shift 20 points from stocks to cash. Each shift is clamped
/// to [0, 100].

#include "finplan/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finplan::advisors {

enum class RiskProfile { Conservative, Moderate, Aggressive };

[[nodiscard]] std::string_view to_string(RiskProfile profile) noexcept;

/// Case-insensitive.
[[nodiscard]] std::optional<RiskProfile> parse_risk_profile(std::string_view label) noexcept;

struct AssetAllocation {
    int stocks = 0;
    int bonds  = 0;
    int gold   = 0;
    int cash   = 0;
    std::vector<std::string> guidance;

    [[nodiscard]] std::string to_string() const;
};

class InvestmentAdvisor {
public:
    /// # Errors
    /// `horizon_years` ≤ 0.
    [[nodiscard]] Result<AssetAllocation> strategy(RiskProfile profile, int horizon_years) const;
};

}  // namespace finplan::advisors
