#include <subrelease/filename/filename.hpp>
#include <subrelease/internal/normalization.hpp>

#include <algorithm>

namespace subrelease {
namespace filename {

const std::vector<std::string>& subtitle_extensions() {
    static const std::vector<std::string> extensions = {
        "srt", "sub", "ssa", "ass", "vtt", "smi", "sami", "txt", "idx", "mpl",
        "dfxp", "ttml", "sbv", "usf", "jss", "psb", "pjs", "stl", "lrc",
    };
    return extensions;
}

const std::vector<std::string>& video_extensions() {
    static const std::vector<std::string> extensions = {
        "mkv", "mp4", "avi", "m4v", "mov", "wmv", "mpg", "mpeg", "ts",
        "m2ts", "webm", "flv", "ogm", "divx", "3gp", "vob",
    };
    return extensions;
}

namespace {

bool has_extension_in(std::string_view filename, const std::vector<std::string>& extensions) {
    std::string ext = get_file_extension(filename);
    if (ext.empty()) {
        return false;
    }
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

}  // namespace

std::string get_file_extension(std::string_view filename) {
    std::string name = basename(filename);
    auto pos = name.find_last_of('.');
    if (pos == std::string::npos || pos == 0 || pos + 1 == name.size()) {
        return "";
    }
    return normalization::to_lower(name.substr(pos + 1));
}

std::string basename(std::string_view path) {
    auto pos = path.find_last_of("/\\");
    if (pos != std::string_view::npos) {
        return std::string(path.substr(pos + 1));
    }
    return std::string(path);
}

bool is_subtitle_file(std::string_view filename) {
    return has_extension_in(filename, subtitle_extensions());
}

bool is_video_file(std::string_view filename) {
    return has_extension_in(filename, video_extensions());
}

std::string strip_extension(
    std::string_view filename, const std::vector<std::string>& extensions) {
    auto pos = filename.find_last_of('.');
    if (pos == std::string_view::npos || pos == 0) {
        return std::string(filename);
    }

    std::string ext = normalization::to_lower(filename.substr(pos + 1));
    for (const auto& candidate : extensions) {
        if (normalization::to_lower(candidate) == ext) {
            return std::string(filename.substr(0, pos));
        }
    }
    return std::string(filename);
}

std::string strip_subtitle_extension(std::string_view filename) {
    return strip_extension(filename, subtitle_extensions());
}

std::string strip_video_extension(std::string_view filename) {
    return strip_extension(filename, video_extensions());
}

}  // namespace filename
}  // namespace subrelease
