#include <subrelease/filename/filename.hpp>
#include <subrelease/matching/matching.hpp>
#include <subrelease/release/release.hpp>

#include <spdlog/spdlog.h>

namespace subrelease {
namespace matching {

PairingResult pair_subtitles(
    const std::vector<std::string>& videos,
    const std::vector<std::string>& subtitles,
    const language::LanguageTable& table,
    const Config& config) {
    // Video names without directory and extension, parallel to video_files
    std::vector<std::string> video_files;
    std::vector<std::string> video_names;
    for (const auto& video : videos) {
        if (!filename::is_video_file(video)) {
            spdlog::debug("[pair_subtitles] '{}' is not a video file, skipped", video);
            continue;
        }
        video_files.push_back(video);
        video_names.push_back(filename::strip_video_extension(filename::basename(video)));
    }

    std::vector<SubtitlePair> slots(video_files.size());
    for (std::size_t i = 0; i < video_files.size(); ++i) {
        slots[i].video = video_files[i];
    }

    PairingResult result;
    for (const auto& subtitle : subtitles) {
        if (!filename::is_subtitle_file(subtitle)) {
            spdlog::debug("[pair_subtitles] '{}' is not a subtitle file, skipped", subtitle);
            continue;
        }

        std::string cleaned =
            release::clean_release_name(filename::basename(subtitle), table, config.release);
        auto best = find_best_match(cleaned, video_names, config.matching);
        if (!best.found()) {
            spdlog::debug("[pair_subtitles] no video for '{}' (release '{}')", subtitle, cleaned);
            result.unmatched_subtitles.push_back(subtitle);
            continue;
        }

        spdlog::debug("[pair_subtitles] '{}' -> '{}' (score {:.2f})", subtitle,
                      video_files[best.index], best.score);
        slots[best.index].subtitles.push_back(
            MatchedSubtitle{.filename = subtitle,
                            .release = cleaned,
                            .score = best.score,
                            .confidence = match_confidence(cleaned, best.match)});
    }

    for (auto& slot : slots) {
        if (!slot.subtitles.empty()) {
            result.pairs.push_back(std::move(slot));
        }
    }
    return result;
}

}  // namespace matching
}  // namespace subrelease
