#pragma once

/// @file release.hpp
/// @brief Release-name extraction from subtitle filenames

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <subrelease/config.hpp>
#include <subrelease/language/language.hpp>
#include <subrelease/release/tags.hpp>

namespace subrelease {
namespace release {

/// @brief Everything learned while extracting a release name
struct ReleaseAnalysis {
    /// The input as given
    std::string original;
    /// Cleaned release name without the leading space, or empty if none was found
    std::optional<std::string> release;
    /// Removed subtitle extension (lowercase), empty in release-name mode
    std::string extension;
    /// Removed tags, rightmost first
    std::vector<StrippedTag> stripped_tags;
    /// Language keys of the removed language tags, rightmost first, without duplicates
    std::vector<std::string> languages;
    /// True if a hearing-impaired marker was removed
    bool hearing_impaired = false;
    /// The removed disc marker (e.g. "CD1"), empty if none
    std::string disc;

    /// Check if a release name was found
    [[nodiscard]] bool found() const { return release.has_value(); }
};

/// @brief Runs normalization, tag stripping and validation on a filename
///
/// @param filename Subtitle filename, or a bare release name in release-name mode
/// @param table Language lookup table
/// @param options Extraction options
/// @return The full analysis; release is empty when the result is too short
[[nodiscard]] ReleaseAnalysis analyze_release(
    std::string_view filename,
    const language::LanguageTable& table,
    const ReleaseOptions& options = default_release_options());

/// @brief Extracts the release name from a subtitle filename
///
/// The returned value starts with a single space, e.g.
/// "Movie.Name.2024.eng.srt" gives " Movie.Name.2024". Callers that
/// display or compare the value must trim it (clean_release_name does).
///
/// @param filename Subtitle filename, or a bare release name
/// @param table Language lookup table
/// @param release_name_mode If true, skip extension removal
/// @return The release name with a leading space, or std::nullopt if the
///         stripped result is shorter than three characters
[[nodiscard]] std::optional<std::string> get_release_from_sub_filename(
    std::string_view filename,
    const language::LanguageTable& table,
    bool release_name_mode = false);

/// @brief Extracts the release name using explicit options
[[nodiscard]] std::optional<std::string> get_release_from_sub_filename(
    std::string_view filename,
    const language::LanguageTable& table,
    const ReleaseOptions& options);

/// @brief Cleans a filename down to its release name
///
/// Never fails: if no release name can be extracted the input is returned
/// unchanged.
[[nodiscard]] std::string clean_release_name(
    std::string_view filename, const language::LanguageTable& table);

/// @brief Cleans a filename down to its release name using explicit options
[[nodiscard]] std::string clean_release_name(
    std::string_view filename,
    const language::LanguageTable& table,
    const ReleaseOptions& options);

}  // namespace release
}  // namespace subrelease
