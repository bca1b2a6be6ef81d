#pragma once

/// @file matching.hpp
/// @brief Release-name similarity and subtitle/video pairing

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <subrelease/config.hpp>
#include <subrelease/language/language.hpp>

namespace subrelease {
namespace matching {

/// @brief Normalizes a release name for comparison
///
/// Case-folds the name and turns every run of separators into one space, so
/// "Movie.Name_2024" and "movie name 2024" compare equal.
[[nodiscard]] std::string normalize_release_key(std::string_view name);

/// @brief Calculates the similarity between two release names
///
/// The comparison uses normalize_release_key on both sides and returns a
/// value between 0 and 1, where 1 indicates an exact match.
[[nodiscard]] double similarity(std::string_view s1, std::string_view s2);

/// @brief Result of find_best_match
struct BestMatchResult {
    /// The best matching candidate, or empty if no match above threshold
    std::string match;
    /// Position of the match in the candidate list
    std::size_t index = 0;
    /// Similarity score (0-1), or 0 if no match
    double score = 0.0;

    /// Check if a match was found
    [[nodiscard]] bool found() const { return !match.empty() && score > 0; }
};

/// @brief Finds the most similar candidate
///
/// Ties keep the earlier candidate.
///
/// @param search_term The release name to search for
/// @param candidates Candidate names
/// @param options Pairing options (minimum similarity)
/// @return The best match, or an empty result if none reaches the minimum
[[nodiscard]] BestMatchResult find_best_match(
    std::string_view search_term,
    const std::vector<std::string>& candidates,
    const MatchOptions& options = {});

/// @brief Match confidence level
enum class MatchConfidence {
    Exact,   ///< Equal after normalization
    High,    ///< Score >= 0.95
    Medium,  ///< Score >= 0.85
    Low,     ///< Score >= 0.75
    None     ///< Score < 0.75
};

/// @brief Returns the confidence level for two release names
[[nodiscard]] MatchConfidence match_confidence(std::string_view s1, std::string_view s2);

/// @brief Converts MatchConfidence to string
[[nodiscard]] std::string to_string(MatchConfidence confidence);

/// @brief A subtitle assigned to a video
struct MatchedSubtitle {
    /// Subtitle filename as given
    std::string filename;
    /// Cleaned release name used for the comparison
    std::string release;
    double score = 0.0;
    MatchConfidence confidence = MatchConfidence::None;
};

/// @brief A video with the subtitles assigned to it
struct SubtitlePair {
    /// Video filename as given
    std::string video;
    std::vector<MatchedSubtitle> subtitles;
};

/// @brief Result of pair_subtitles
struct PairingResult {
    /// Videos with at least one subtitle, in video input order
    std::vector<SubtitlePair> pairs;
    /// Subtitle files that matched no video, in input order
    std::vector<std::string> unmatched_subtitles;
};

/// @brief Assigns each subtitle file to the video whose name matches its release
///
/// Subtitle names are cleaned with release::clean_release_name and compared
/// with each video's name without directory and video extension. A subtitle
/// goes to the most similar video scoring at least config.matching.min_similarity.
/// Names without a subtitle (resp. video) extension are ignored.
///
/// @param videos Video filenames or paths
/// @param subtitles Subtitle filenames or paths
/// @param table Language lookup table
/// @param config Release and pairing options
[[nodiscard]] PairingResult pair_subtitles(
    const std::vector<std::string>& videos,
    const std::vector<std::string>& subtitles,
    const language::LanguageTable& table,
    const Config& config = default_config());

}  // namespace matching
}  // namespace subrelease
