/// @file src/advisors/investment_advisor.cpp
/// @brief Risk-profile allocation table with horizon adjustments.

#include "finplan/investment.hpp"
#include "finplan/logging.hpp"

#include "../core/text.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace finplan::advisors {

namespace {

constexpr int LONG_HORIZON_YEARS  = 10;
constexpr int SHORT_HORIZON_YEARS = 3;
constexpr int LONG_HORIZON_SHIFT  = 10;
constexpr int SHORT_HORIZON_SHIFT = 20;

AssetAllocation base_allocation(RiskProfile profile) {
    switch (profile) {
        case RiskProfile::Conservative:
            return {30, 50, 15, 5, {"Focus on capital preservation",
                                    "Recommend: Index funds + government bonds"}};
        case RiskProfile::Aggressive:
            return {70, 20, 5, 5, {"Long-term growth focus",
                                   "Recommend: Growth stocks + sector ETFs"}};
        case RiskProfile::Moderate:
            break;
    }
    return {50, 35, 10, 5, {"Balance growth and stability",
                            "Recommend: Balanced mutual funds"}};
}

}  // namespace

std::string_view to_string(RiskProfile profile) noexcept {
    switch (profile) {
        case RiskProfile::Conservative: return "conservative";
        case RiskProfile::Moderate:     return "moderate";
        case RiskProfile::Aggressive:   return "aggressive";
    }
    return "moderate";
}

std::optional<RiskProfile> parse_risk_profile(std::string_view label) noexcept {
    if (text::iequals(label, "conservative")) return RiskProfile::Conservative;
    if (text::iequals(label, "moderate"))     return RiskProfile::Moderate;
    if (text::iequals(label, "aggressive"))   return RiskProfile::Aggressive;
    return std::nullopt;
}

std::string AssetAllocation::to_string() const {
    return fmt::format("stocks={}% bonds={}% gold={}% cash={}%", stocks, bonds, gold, cash);
}

Result<AssetAllocation> InvestmentAdvisor::strategy(RiskProfile profile,
                                                    int horizon_years) const {
    if (horizon_years <= 0) {
        logging::logger()->warn("Rejected investment horizon {}", horizon_years);
        return Result<AssetAllocation>::failure("Investment horizon must be positive");
    }

    AssetAllocation alloc = base_allocation(profile);
    if (horizon_years > LONG_HORIZON_YEARS) {
        alloc.stocks = std::min(alloc.stocks + LONG_HORIZON_SHIFT, 100);
        alloc.bonds  = std::max(alloc.bonds - LONG_HORIZON_SHIFT, 0);
    } else if (horizon_years < SHORT_HORIZON_YEARS) {
        alloc.stocks = std::max(alloc.stocks - SHORT_HORIZON_SHIFT, 0);
        alloc.cash   = std::min(alloc.cash + SHORT_HORIZON_SHIFT, 100);
    }
    logging::logger()->debug("Investment strategy for {} over {} years: {}",
                             advisors::to_string(profile), horizon_years, alloc.to_string());
    return alloc;
}

}  // namespace finplan::advisors
