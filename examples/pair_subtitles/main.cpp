// Example: Pairing Subtitles With Videos
//
// This example groups a folder listing of subtitles under the videos they
// were made for, using the cleaned release name of each subtitle.
//
// To run:
//   ./pair_subtitles

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <subrelease/subrelease.hpp>

int main() {
    using namespace subrelease;

    auto config = make_config({with_min_similarity(0.8), with_log_level("info")});
    apply_log_level(config);

    std::cout << "subrelease " << kVersion << "\n\n";

    std::vector<std::string> videos = {
        "Downloads/Movie.Name.2024.1080p.BluRay.x264-GRP.mkv",
        "Downloads/Other.Film.1999.DVDRip.XviD.avi",
    };
    std::vector<std::string> subtitles = {
        "Downloads/Movie.Name.2024.1080p.BluRay.x264-GRP.eng.srt",
        "Downloads/Movie.Name.2024.1080p.BluRay.x264-GRP.pt-BR.sdh.srt",
        "Downloads/Other.Film.1999.DVDRip.XviD.CD1.Spanish.srt",
        "Downloads/Something.Else.2010.srt",
    };

    auto result = matching::pair_subtitles(
        videos, subtitles, language::builtin_language_table(), config);

    for (const auto& pair : result.pairs) {
        std::cout << "Video: " << pair.video << "\n";
        for (const auto& subtitle : pair.subtitles) {
            std::cout << "  " << subtitle.filename << "\n";
            std::cout << "    release: " << subtitle.release << " (" << std::fixed
                      << std::setprecision(2) << subtitle.score << ", "
                      << matching::to_string(subtitle.confidence) << ")\n";
        }
    }

    if (!result.unmatched_subtitles.empty()) {
        std::cout << "\nUnmatched:\n";
        for (const auto& subtitle : result.unmatched_subtitles) {
            std::cout << "  " << subtitle << "\n";
        }
    }

    return 0;
}
