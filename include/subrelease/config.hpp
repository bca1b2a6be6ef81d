#pragma once

/// @file config.hpp
/// @brief Configuration types for the subrelease library

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <subrelease/filename/filename.hpp>

namespace subrelease {

/// @brief Options controlling release-name extraction
struct ReleaseOptions {
    /// Treat the input as a bare release name (no extension removal)
    bool release_name_mode = false;
    /// Results shorter than this many characters are rejected
    std::size_t min_length = 3;
    /// Subtitle suffixes removed by the filename normalizer (lowercase, no dot)
    std::vector<std::string> subtitle_extensions = filename::subtitle_extensions();
    /// Short codes stripped in addition to the language table codes
    std::vector<std::string> extra_codes = {"pt-br"};
    /// Full names stripped in addition to the language table names
    std::vector<std::string> extra_names = {"Portuguese", "addic7ed.com"};
};

/// @brief Returns the default extraction options
[[nodiscard]] ReleaseOptions default_release_options();

/// @brief Options controlling subtitle/video pairing
struct MatchOptions {
    /// Minimum similarity (0-1) between a subtitle release and a video name
    double min_similarity = 0.75;
};

/// @brief Main configuration for the library
struct Config {
    /// Release-name extraction options
    ReleaseOptions release;
    /// Pairing options
    MatchOptions matching;
    /// spdlog level name ("trace", "debug", "info", "warn", "error", "critical", "off")
    std::string log_level = "warn";
};

/// @brief Returns a configuration with sensible defaults
[[nodiscard]] Config default_config();

/// @brief Functional option type for configuring the library
using ConfigOption = std::function<void(Config&)>;

/// @brief Applies options to the default configuration and validates the result
///
/// @throws ConfigError if the resulting configuration is invalid
[[nodiscard]] Config make_config(const std::vector<ConfigOption>& options);

/// @brief Checks a configuration for out-of-range values
///
/// @throws ConfigError naming the first offending field
void validate_config(const Config& config);

/// @brief Reads a configuration from a JSON object
///
/// Missing fields keep their defaults. The result is validated.
///
/// @throws ConfigError on wrong field types or invalid values
[[nodiscard]] Config config_from_json(const nlohmann::json& j);

/// @brief Sets the global spdlog level from Config::log_level
void apply_log_level(const Config& config);

/// @brief Treats every input as a bare release name
[[nodiscard]] ConfigOption with_release_name_mode(bool enabled = true);

/// @brief Sets the minimum accepted release length
[[nodiscard]] ConfigOption with_min_length(std::size_t min_length);

/// @brief Replaces the recognized subtitle extensions
[[nodiscard]] ConfigOption with_subtitle_extensions(const std::vector<std::string>& extensions);

/// @brief Replaces the extra short codes
[[nodiscard]] ConfigOption with_extra_codes(const std::vector<std::string>& codes);

/// @brief Replaces the extra full names
[[nodiscard]] ConfigOption with_extra_names(const std::vector<std::string>& names);

/// @brief Sets the minimum pairing similarity
[[nodiscard]] ConfigOption with_min_similarity(double min_similarity);

/// @brief Sets the log level
[[nodiscard]] ConfigOption with_log_level(const std::string& level);

}  // namespace subrelease
