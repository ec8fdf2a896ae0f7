/// @file src/main.cpp
/// @brief finplan CLI entry point.
///
/// Usage:
///   finplan [-v] --parse "<text>"                       Parse an utterance into transactions
///   finplan [-v] --forecast <csv> [window] [confidence] Forecast next month's spending
///   finplan [-v] --emergency <csv> [stable|variable] [dependents]
///   finplan [-v] --debts <csv> [avalanche|snowball]     Debt payoff plan
///   finplan [-v] --savings <current> <goal> <months> <income>
///   finplan [-v] --invest <profile> <years>             Asset allocation
///   finplan --help                                      Print usage

#include "finplan/csv_loader.hpp"
#include "finplan/debt.hpp"
#include "finplan/emergency.hpp"
#include "finplan/forecast.hpp"
#include "finplan/investment.hpp"
#include "finplan/logging.hpp"
#include "finplan/parser.hpp"
#include "finplan/savings.hpp"
#include "finplan/storage.hpp"

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace finplan;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  finplan [-v] --parse \"<text>\"                        Parse transactions from text\n"
        "  finplan [-v] --forecast <csv> [window] [confidence]  Forecast monthly spending\n"
        "  finplan [-v] --emergency <csv> [stable|variable] [dependents]\n"
        "                                                       Emergency fund range\n"
        "  finplan [-v] --debts <csv> [avalanche|snowball]      Debt payoff plan\n"
        "  finplan [-v] --savings <current> <goal> <months> <income>\n"
        "                                                       Savings goal feasibility\n"
        "  finplan [-v] --invest <profile> <years>              Asset allocation\n"
        "  finplan --help                                       Show this help\n"
        "\n"
        "Transaction CSV (header required):\n"
        "  date,description,amount,type,main_category,sub_category[,currency,person,group,split]\n"
        "Debt CSV (header required):\n"
        "  balance,rate,min_payment[,label]\n"
    );
}

template <typename T>
std::optional<T> parse_number(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

/// Load a transaction CSV or report why not. Empty optional means error.
std::optional<std::vector<TransactionRecord>> load_history(const std::string& filepath) {
    core::CsvLoader loader(CategoryTaxonomy::standard());
    auto loaded = loader.load_transactions(filepath);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return std::nullopt;
    }
    fmt::print("Loaded {} transactions from '{}' ({} rows skipped)\n",
               loaded->rows.size(), filepath, loaded->skipped);
    return std::move(loaded->rows);
}

int run_parse(const std::string& utterance) {
    TransactionParser parser(CategoryTaxonomy::standard());
    storage::InMemoryTransactionStore store;

    const ParseReport report = parser.process(utterance, store);
    fmt::print("Status: {} ({})\n", to_string(report.status), report.message());
    for (const auto& t : report.transactions) {
        fmt::print("  + {}\n", t.to_string());
    }
    for (const auto& e : report.errors) {
        fmt::print("  ! {}\n", e);
    }
    return report.status == ParseStatus::Error ? 1 : 0;
}

int run_forecast(const std::string& filepath, std::size_t window, double confidence) {
    const auto history = load_history(filepath);
    if (!history) return 1;

    const auto result = advisors::BudgetForecaster::forecast_spending(*history, window, confidence);
    if (!result) {
        fmt::print(stderr, "Error: {}\n", result.error());
        return 1;
    }
    fmt::print("{}\n", result->to_string());
    return 0;
}

int run_emergency(const std::string& filepath, advisors::IncomeStability stability,
                  int dependents) {
    const auto history = load_history(filepath);
    if (!history) return 1;

    const auto result = advisors::EmergencyFundAdvisor{}.recommend(*history, stability, dependents);
    if (!result) {
        fmt::print(stderr, "Error: {}\n", result.error());
        return 1;
    }
    fmt::print("{}\n", result->to_string());
    return 0;
}

int run_debts(const std::string& filepath, advisors::PayoffMethod method) {
    const auto debts = core::CsvLoader::load_debts(filepath);
    if (!debts) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    fmt::print("Loaded {} debts from '{}' ({} rows skipped)\n",
               debts->rows.size(), filepath, debts->skipped);

    const auto plan = advisors::DebtOptimizer{}.optimize(debts->rows, method);
    if (!plan) {
        fmt::print(stderr, "Error: {}\n", plan.error());
        return 1;
    }
    fmt::print("{}\n", plan->to_string());
    for (const auto& d : plan->schedule) {
        fmt::print("  {:<20} paid off in month {:4d}, interest {:.2f}\n",
                   d.label, d.payoff_month, d.interest_paid);
    }
    return 0;
}

int run_savings(double current, double goal, std::size_t months, double income) {
    const auto plan = advisors::SavingsOptimizer{}.calculate_plan(current, goal, months, income);
    if (!plan) {
        fmt::print(stderr, "Error: {}\n", plan.error());
        return 1;
    }
    fmt::print("{}\n", plan->to_string());
    if (plan->reconsider_plan) {
        fmt::print("Success probability is low; consider a longer timeframe or a smaller goal.\n");
    }
    return 0;
}

int run_invest(advisors::RiskProfile profile, int years) {
    const auto alloc = advisors::InvestmentAdvisor{}.strategy(profile, years);
    if (!alloc) {
        fmt::print(stderr, "Error: {}\n", alloc.error());
        return 1;
    }
    fmt::print("{}\n", alloc->to_string());
    for (const auto& line : alloc->guidance) fmt::print("  - {}\n", line);
    return 0;
}

int bad_argument(std::string_view what) {
    fmt::print(stderr, "Error: invalid {}\n", what);
    print_usage();
    return 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty() && (args.front() == "-v" || args.front() == "--verbose")) {
        finplan::logging::set_level(spdlog::level::debug);
        args.erase(args.begin());
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& mode = args[0];
    auto arg = [&](std::size_t i) -> std::optional<std::string> {
        if (i < args.size()) return args[i];
        return std::nullopt;
    };

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--parse") {
        if (args.size() < 2) return bad_argument("--parse: missing text");
        std::string utterance = args[1];
        for (std::size_t i = 2; i < args.size(); ++i) utterance += " " + args[i];
        return run_parse(utterance);
    }

    if (mode == "--forecast") {
        if (args.size() < 2) return bad_argument("--forecast: missing CSV path");
        std::size_t window = finplan::constants::DEFAULT_FORECAST_WINDOW;
        double confidence = finplan::constants::DEFAULT_CONFIDENCE_LEVEL;
        if (auto w = arg(2)) {
            auto v = parse_number<std::size_t>(*w);
            if (!v) return bad_argument("window");
            window = *v;
        }
        if (auto c = arg(3)) {
            auto v = parse_number<double>(*c);
            if (!v) return bad_argument("confidence");
            confidence = *v;
        }
        return run_forecast(args[1], window, confidence);
    }

    if (mode == "--emergency") {
        if (args.size() < 2) return bad_argument("--emergency: missing CSV path");
        auto stability = finplan::advisors::IncomeStability::Stable;
        int dependents = 0;
        if (auto s = arg(2)) {
            auto v = finplan::advisors::parse_income_stability(*s);
            if (!v) return bad_argument("income stability");
            stability = *v;
        }
        if (auto d = arg(3)) {
            auto v = parse_number<int>(*d);
            if (!v) return bad_argument("dependents");
            dependents = *v;
        }
        return run_emergency(args[1], stability, dependents);
    }

    if (mode == "--debts") {
        if (args.size() < 2) return bad_argument("--debts: missing CSV path");
        auto method = finplan::advisors::PayoffMethod::Avalanche;
        if (auto m = arg(2)) {
            auto v = finplan::advisors::parse_payoff_method(*m);
            if (!v) return bad_argument("payoff method");
            method = *v;
        }
        return run_debts(args[1], method);
    }

    if (mode == "--savings") {
        if (args.size() < 5) return bad_argument("--savings: expected 4 numbers");
        const auto current = parse_number<double>(args[1]);
        const auto goal    = parse_number<double>(args[2]);
        const auto months  = parse_number<std::size_t>(args[3]);
        const auto income  = parse_number<double>(args[4]);
        if (!current || !goal || !months || !income) return bad_argument("savings inputs");
        return run_savings(*current, *goal, *months, *income);
    }

    if (mode == "--invest") {
        if (args.size() < 3) return bad_argument("--invest: expected profile and years");
        const auto profile = finplan::advisors::parse_risk_profile(args[1]);
        const auto years   = parse_number<int>(args[2]);
        if (!profile || !years) return bad_argument("investment inputs");
        return run_invest(*profile, *years);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
