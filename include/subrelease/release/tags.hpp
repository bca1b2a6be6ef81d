#pragma once

/// @file tags.hpp
/// @brief Trailing tag recognition for subtitle release names
///
/// A tag is a token at the end of a release name that describes one subtitle
/// file rather than the release itself: a hearing-impaired marker, a disc
/// marker, or a language given as a regional code, a plain code or a name.
/// Each tag class is recognized by an independent matcher; the stripper asks
/// the matchers in priority order and removes the first match it gets.

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <subrelease/config.hpp>
#include <subrelease/language/language.hpp>

namespace subrelease {
namespace release {

/// @brief Tag classes, in matching priority order
enum class TagKind {
    HearingImpaired,   ///< "sdh"
    Disc,              ///< "CD1", "CD I"
    RegionalLanguage,  ///< "pt-BR", "en-US"
    LanguageCode,      ///< "eng", "es"
    LanguageName       ///< "English", "Spanish"
};

/// @brief Converts TagKind to string
[[nodiscard]] std::string to_string(TagKind kind);

/// @brief A code or name that identifies a language
struct VocabularyTerm {
    std::string text;
    /// Key of the language table entry, empty for configured extras
    std::string language_key;
};

/// @brief Language terms derived from a table for the duration of one call
///
/// Every list is ordered longest first so that the longest term wins.
struct TagVocabulary {
    /// Two- and three-letter table codes plus the configured extra codes
    std::vector<VocabularyTerm> short_codes;
    /// Two-letter table codes, used for regional variants
    std::vector<VocabularyTerm> two_letter_codes;
    /// Canonical, display and native names plus the configured extra names
    std::vector<VocabularyTerm> full_names;
};

/// @brief Builds the vocabulary for a table and a set of options
[[nodiscard]] TagVocabulary build_vocabulary(
    const language::LanguageTable& table, const ReleaseOptions& options);

/// @brief A tag recognized at the end of a working string
struct TagMatch {
    /// Length in bytes of the tag at the end of the body
    std::size_t length = 0;
    /// Text that takes the place of the tag and its leading separators
    std::string replacement;
    TagKind kind = TagKind::LanguageCode;
    /// Language table key for language tags, otherwise empty
    std::string language_key;
};

/// @brief Recognizes one class of tag at the end of a body
///
/// The body never ends with a separator. A matcher only reports a tag that is
/// preceded by a separator.
using TagMatcher =
    std::function<std::optional<TagMatch>(std::string_view body, const TagVocabulary& vocabulary)>;

/// @brief Matches a trailing "sdh" token
[[nodiscard]] std::optional<TagMatch> match_hearing_impaired(
    std::string_view body, const TagVocabulary& vocabulary);

/// @brief Matches "CD" followed by a digit or "I", with an optional space in between
[[nodiscard]] std::optional<TagMatch> match_disc(
    std::string_view body, const TagVocabulary& vocabulary);

/// @brief Matches a two-letter table code, '-', and any two-letter region
[[nodiscard]] std::optional<TagMatch> match_regional_language(
    std::string_view body, const TagVocabulary& vocabulary);

/// @brief Matches a short language code
[[nodiscard]] std::optional<TagMatch> match_language_code(
    std::string_view body, const TagVocabulary& vocabulary);

/// @brief Matches a full language name
[[nodiscard]] std::optional<TagMatch> match_language_name(
    std::string_view body, const TagVocabulary& vocabulary);

/// @brief Returns the built-in matchers in priority order
[[nodiscard]] const std::vector<TagMatcher>& default_tag_matchers();

/// @brief A tag removed by strip_trailing_tags
struct StrippedTag {
    TagKind kind = TagKind::LanguageCode;
    /// The tag as it appeared in the input
    std::string text;
    std::string language_key;
};

/// @brief Result of strip_trailing_tags
struct StripResult {
    /// Working string after all removals
    std::string remainder;
    /// Removed tags, rightmost first
    std::vector<StrippedTag> tags;
};

/// @brief Repeatedly removes the rightmost recognized tag
///
/// Each removal also drops the run of separators in front of the tag. The
/// loop ends when no matcher recognizes the tail of the working string.
///
/// @param working The string to strip (extension already removed)
/// @param vocabulary Language terms for the call
/// @param matchers Matchers in priority order
/// @return The remainder and the removed tags
[[nodiscard]] StripResult strip_trailing_tags(
    std::string_view working,
    const TagVocabulary& vocabulary,
    const std::vector<TagMatcher>& matchers = default_tag_matchers());

}  // namespace release
}  // namespace subrelease
