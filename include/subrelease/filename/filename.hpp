#pragma once

/// @file filename.hpp
/// @brief Filename classification and extension handling for subtitle and video files

#include <string>
#include <string_view>
#include <vector>

namespace subrelease {
namespace filename {

/// @brief Recognized subtitle file suffixes (lowercase, without the dot)
///
/// Safe to call during static initialization.
[[nodiscard]] const std::vector<std::string>& subtitle_extensions();

/// @brief Recognized video file suffixes (lowercase, without the dot)
[[nodiscard]] const std::vector<std::string>& video_extensions();

/// @brief Returns the file extension from a filename (without the dot, lowercased)
///
/// A dot in the first position (hidden files such as ".srt") does not start an extension.
[[nodiscard]] std::string get_file_extension(std::string_view filename);

/// @brief Returns the filename without any directory prefix ('/' or '\\')
[[nodiscard]] std::string basename(std::string_view path);

/// @brief Checks if the filename has a subtitle extension
[[nodiscard]] bool is_subtitle_file(std::string_view filename);

/// @brief Checks if the filename has a video extension
[[nodiscard]] bool is_video_file(std::string_view filename);

/// @brief Removes one trailing extension if it is in the given list
///
/// The comparison ignores case. A name without a recognized extension is
/// returned unchanged.
///
/// @param filename The filename to strip
/// @param extensions Lowercase suffixes without the dot
/// @return The filename without the recognized extension
[[nodiscard]] std::string strip_extension(
    std::string_view filename, const std::vector<std::string>& extensions);

/// @brief Removes one trailing subtitle extension
[[nodiscard]] std::string strip_subtitle_extension(std::string_view filename);

/// @brief Removes one trailing video extension
[[nodiscard]] std::string strip_video_extension(std::string_view filename);

}  // namespace filename
}  // namespace subrelease
