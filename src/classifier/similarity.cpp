/// @file src/classifier/similarity.cpp
/// @brief 0–100 string similarity scorers used by the category classifier.

#include "finplan/similarity.hpp"

#include "../core/text.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <iterator>
#include <set>

namespace finplan::similarity {

namespace {

/// Highest possible score; scans stop once it is reached.
constexpr int PERFECT_SCORE = 100;

/// Length ratio from which partial scorers join the blend.
constexpr double PARTIAL_LENGTH_RATIO = 1.5;

/// Length ratio beyond which partial scores are heavily discounted.
constexpr double FAR_LENGTH_RATIO = 8.0;

constexpr double UNBASE_SCALE      = 0.95;
constexpr double PARTIAL_SCALE     = 0.90;
constexpr double FAR_PARTIAL_SCALE = 0.60;

using Scorer = std::function<int(std::string_view, std::string_view)>;

/// Longest common subsequence length (two-row DP).
std::size_t lcs_length(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) std::swap(a, b);
    std::vector<std::size_t> prev(b.size() + 1, 0);
    std::vector<std::size_t> curr(b.size() + 1, 0);
    for (char ca : a) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            curr[j] = (ca == b[j - 1]) ? prev[j - 1] + 1
                                       : std::max(prev[j], curr[j - 1]);
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

// The *_norm scorers expect already-normalised input.

int ratio_norm(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return 0;
    const double total = static_cast<double>(a.size() + b.size());
    const double score = 2.0 * static_cast<double>(lcs_length(a, b)) / total;
    return static_cast<int>(std::lround(100.0 * score));
}

int partial_ratio_norm(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return 0;
    std::string_view shorter = a.size() <= b.size() ? a : b;
    std::string_view longer  = a.size() <= b.size() ? b : a;
    if (shorter.size() == longer.size()) return ratio_norm(shorter, longer);

    int best = 0;
    for (std::size_t i = 0; i + shorter.size() <= longer.size(); ++i) {
        best = std::max(best, ratio_norm(shorter, longer.substr(i, shorter.size())));
        if (best == PERFECT_SCORE) break;
    }
    return best;
}

std::string sorted_tokens(std::string_view s) {
    auto tokens = text::split_whitespace(s);
    std::sort(tokens.begin(), tokens.end());
    return text::join(tokens, " ");
}

int token_set_norm(std::string_view a, std::string_view b, const Scorer& scorer) {
    if (a.empty() || b.empty()) return 0;

    const auto ta = text::split_whitespace(a);
    const auto tb = text::split_whitespace(b);
    const std::set<std::string> sa(ta.begin(), ta.end());
    const std::set<std::string> sb(tb.begin(), tb.end());

    std::vector<std::string> common, only_a, only_b;
    std::set_intersection(sa.begin(), sa.end(), sb.begin(), sb.end(),
                          std::back_inserter(common));
    std::set_difference(sa.begin(), sa.end(), sb.begin(), sb.end(),
                        std::back_inserter(only_a));
    std::set_difference(sb.begin(), sb.end(), sa.begin(), sa.end(),
                        std::back_inserter(only_b));

    const std::string sect = text::join(common, " ");
    const std::string combined_a =
        std::string(text::trim(sect + " " + text::join(only_a, " ")));
    const std::string combined_b =
        std::string(text::trim(sect + " " + text::join(only_b, " ")));

    return std::max({scorer(sect, combined_a),
                     scorer(sect, combined_b),
                     scorer(combined_a, combined_b)});
}

int weighted_norm(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return 0;

    const double base = ratio_norm(a, b);
    const double len_ratio =
        static_cast<double>(std::max(a.size(), b.size())) /
        static_cast<double>(std::min(a.size(), b.size()));

    if (len_ratio < PARTIAL_LENGTH_RATIO) {
        const double tsor = ratio_norm(sorted_tokens(a), sorted_tokens(b)) * UNBASE_SCALE;
        const double tser = token_set_norm(a, b, ratio_norm) * UNBASE_SCALE;
        return static_cast<int>(std::lround(std::max({base, tsor, tser})));
    }

    const double scale = len_ratio > FAR_LENGTH_RATIO ? FAR_PARTIAL_SCALE : PARTIAL_SCALE;
    const double partial = partial_ratio_norm(a, b) * scale;
    const double ptsor =
        partial_ratio_norm(sorted_tokens(a), sorted_tokens(b)) * UNBASE_SCALE * scale;
    const double ptser = token_set_norm(a, b, partial_ratio_norm) * UNBASE_SCALE * scale;
    return static_cast<int>(std::lround(std::max({base, partial, ptsor, ptser})));
}

}  // namespace

// ─── Normalisation ────────────────────────────────────────────────────────────

std::string normalize(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (u >= 0x80) continue;  // non-ASCII is dropped, not spaced
        out.push_back(std::isalnum(u) ? static_cast<char>(std::tolower(u)) : ' ');
    }
    return text::collapse_whitespace(out);
}

// ─── Public scorers ───────────────────────────────────────────────────────────

int ratio(std::string_view a, std::string_view b) {
    return ratio_norm(normalize(a), normalize(b));
}

int partial_ratio(std::string_view a, std::string_view b) {
    return partial_ratio_norm(normalize(a), normalize(b));
}

int token_sort_ratio(std::string_view a, std::string_view b) {
    return ratio_norm(sorted_tokens(normalize(a)), sorted_tokens(normalize(b)));
}

int token_set_ratio(std::string_view a, std::string_view b) {
    return token_set_norm(normalize(a), normalize(b), ratio_norm);
}

int partial_token_sort_ratio(std::string_view a, std::string_view b) {
    return partial_ratio_norm(sorted_tokens(normalize(a)), sorted_tokens(normalize(b)));
}

int partial_token_set_ratio(std::string_view a, std::string_view b) {
    return token_set_norm(normalize(a), normalize(b), partial_ratio_norm);
}

int weighted_ratio(std::string_view a, std::string_view b) {
    return weighted_norm(normalize(a), normalize(b));
}

// ─── best_match ───────────────────────────────────────────────────────────────

std::optional<Match>
best_match(std::string_view query, const std::vector<std::string>& candidates) {
    if (candidates.empty()) return std::nullopt;

    const std::string q = normalize(query);
    Match best{0, -1};
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const int score = weighted_norm(q, normalize(candidates[i]));
        if (score > best.score) {
            best = Match{i, score};
            if (score == PERFECT_SCORE) break;
        }
    }
    return best;
}

}  // namespace finplan::similarity
