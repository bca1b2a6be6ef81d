#include <subrelease/internal/normalization.hpp>
#include <subrelease/matching/matching.hpp>

#include <rapidfuzz/fuzz.hpp>

namespace subrelease {
namespace matching {

std::string normalize_release_key(std::string_view name) {
    std::string folded = normalization::fold_case(normalization::trim_edges(name));
    std::string key;
    key.reserve(folded.size());
    bool pending_space = false;
    for (char c : folded) {
        if (normalization::is_separator(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !key.empty()) {
            key += ' ';
        }
        pending_space = false;
        key += c;
    }
    return key;
}

double similarity(std::string_view s1, std::string_view s2) {
    std::string key1 = normalize_release_key(s1);
    std::string key2 = normalize_release_key(s2);
    if (key1 == key2) {
        return 1.0;
    }
    // rapidfuzz returns 0-100, normalize to 0-1
    return rapidfuzz::fuzz::ratio(key1, key2) / 100.0;
}

BestMatchResult find_best_match(
    std::string_view search_term,
    const std::vector<std::string>& candidates,
    const MatchOptions& options) {
    if (candidates.empty()) {
        return BestMatchResult{};
    }

    std::string best_match;
    std::size_t best_index = 0;
    double best_score = 0.0;

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        double score = similarity(search_term, candidates[i]);

        if (score > best_score) {
            best_score = score;
            best_match = candidates[i];
            best_index = i;

            // Early exit for perfect match
            if (score == 1.0) {
                break;
            }
        }
    }

    if (best_score >= options.min_similarity && best_score > 0.0) {
        return BestMatchResult{.match = best_match, .index = best_index, .score = best_score};
    }

    return BestMatchResult{};
}

MatchConfidence match_confidence(std::string_view s1, std::string_view s2) {
    if (normalize_release_key(s1) == normalize_release_key(s2)) {
        return MatchConfidence::Exact;
    }

    double score = similarity(s1, s2);

    if (score >= 0.95) return MatchConfidence::High;
    if (score >= 0.85) return MatchConfidence::Medium;
    if (score >= 0.75) return MatchConfidence::Low;
    return MatchConfidence::None;
}

std::string to_string(MatchConfidence confidence) {
    switch (confidence) {
    case MatchConfidence::Exact:
        return "exact";
    case MatchConfidence::High:
        return "high";
    case MatchConfidence::Medium:
        return "medium";
    case MatchConfidence::Low:
        return "low";
    case MatchConfidence::None:
        return "none";
    }
    return "unknown";
}

}  // namespace matching
}  // namespace subrelease
