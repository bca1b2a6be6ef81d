#pragma once

/// @file normalization.hpp
/// @brief Text helpers shared by the release engine and the pairing code

#include <cstddef>
#include <string>
#include <string_view>

namespace subrelease {
namespace normalization {

/// @brief Characters that separate tokens in a release name
constexpr std::string_view kSeparators = ".-_ ";

/// @brief Characters trimmed from both ends of an extracted release
constexpr std::string_view kEdgeCharacters = ",.-_=";

/// @brief Returns true for '.', '-', '_' and ' '
[[nodiscard]] constexpr bool is_separator(char c) noexcept {
    return kSeparators.find(c) != std::string_view::npos;
}

/// @brief Lowercases ASCII letters, leaving other bytes untouched
[[nodiscard]] std::string to_lower(std::string_view str);

/// @brief Removes leading and trailing whitespace
[[nodiscard]] std::string trim(std::string_view str);

/// @brief Removes leading and trailing separator, comma and equals characters and whitespace
[[nodiscard]] std::string trim_edges(std::string_view str);

/// @brief Number of trailing separator characters in str
[[nodiscard]] std::size_t trailing_separator_count(std::string_view str) noexcept;

/// @brief Unicode case folding of a UTF-8 string
[[nodiscard]] std::string fold_case(std::string_view str);

/// @brief Case-insensitive comparison using Unicode case folding
[[nodiscard]] bool iequals(std::string_view s1, std::string_view s2);

/// @brief Checks whether str ends with suffix, ignoring case
///
/// The comparison covers the last suffix.size() bytes of str, so the match
/// length in str always equals suffix.size().
[[nodiscard]] bool ends_with_icase(std::string_view str, std::string_view suffix);

/// @brief Number of Unicode code points in a UTF-8 string
[[nodiscard]] std::size_t code_point_count(std::string_view str);

/// @brief Checks if a string contains non-ASCII characters
[[nodiscard]] bool has_non_ascii(std::string_view str);

}  // namespace normalization
}  // namespace subrelease
