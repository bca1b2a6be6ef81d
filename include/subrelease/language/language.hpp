#pragma once

/// @file language.hpp
/// @brief Language lookup table supplied to the release engine

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace subrelease {
namespace language {

/// @brief Codes and names describing one language
struct LanguageEntry {
    /// Key of this entry in its table
    std::string key;
    /// Three-letter code (ISO 639-2, e.g. "eng")
    std::string iso639;
    /// Two-letter code (ISO 639-1, e.g. "en")
    std::string language_code;
    /// Alternate three-letter code (e.g. "fra" next to "fre"), may be empty
    std::string iso639_3;
    /// Canonical language name (e.g. "English")
    std::string language_name;
    /// Name shown to users
    std::string display_name;
    /// Native spelling (e.g. "Português"), may be empty
    std::string original_name;
};

/// @brief Language entries keyed by their short identifier
using LanguageTable = std::map<std::string, LanguageEntry>;

/// @brief Builds a table from a JSON object of language records
///
/// The expected shape is the one served by the subtitle catalog:
/// @code
/// {"en": {"iso639": "eng", "language_code": "en", "languageName": "English",
///         "displayName": "English", "iso639_3": "eng", "originalName": "English"}}
/// @endcode
/// Codes are stored lowercased. Fields with a non-string value are skipped.
///
/// @throws LanguageTableError if the root or an entry is not an object
[[nodiscard]] LanguageTable language_table_from_json(const nlohmann::json& j);

/// @brief Reads a language table from a JSON file
///
/// @throws LanguageTableError if the file is missing, unreadable or malformed
[[nodiscard]] LanguageTable load_language_table(const std::filesystem::path& path);

/// @brief Returns a compiled-in table of common subtitle languages
[[nodiscard]] const LanguageTable& builtin_language_table();

/// @brief Finds an entry by two-letter, three-letter or alternate code (case-insensitive)
///
/// @return The entry, or nullptr if no entry carries the code
[[nodiscard]] const LanguageEntry* find_by_code(const LanguageTable& table, std::string_view code);

/// @brief Finds an entry by canonical, display or native name (case-insensitive)
///
/// @return The entry, or nullptr if no entry carries the name
[[nodiscard]] const LanguageEntry* find_by_name(const LanguageTable& table, std::string_view name);

}  // namespace language
}  // namespace subrelease
