#include <subrelease/filename/filename.hpp>
#include <subrelease/internal/normalization.hpp>
#include <subrelease/release/release.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace subrelease {
namespace release {

ReleaseAnalysis analyze_release(
    std::string_view subfilename,
    const language::LanguageTable& table,
    const ReleaseOptions& options) {
    ReleaseAnalysis analysis;
    analysis.original = std::string(subfilename);
    if (subfilename.empty()) {
        return analysis;
    }

    std::string working(subfilename);
    if (!options.release_name_mode) {
        working = filename::strip_extension(subfilename, options.subtitle_extensions);
        if (working.size() < subfilename.size()) {
            analysis.extension = normalization::to_lower(subfilename.substr(working.size() + 1));
        }
    }

    const TagVocabulary vocabulary = build_vocabulary(table, options);
    StripResult stripped = strip_trailing_tags(working, vocabulary);

    for (const auto& tag : stripped.tags) {
        switch (tag.kind) {
        case TagKind::HearingImpaired:
            analysis.hearing_impaired = true;
            break;
        case TagKind::Disc:
            if (analysis.disc.empty()) {
                analysis.disc = tag.text;
            }
            break;
        case TagKind::RegionalLanguage:
        case TagKind::LanguageCode:
        case TagKind::LanguageName:
            if (!tag.language_key.empty() &&
                std::find(analysis.languages.begin(), analysis.languages.end(),
                          tag.language_key) == analysis.languages.end()) {
                analysis.languages.push_back(tag.language_key);
            }
            break;
        }
    }
    analysis.stripped_tags = std::move(stripped.tags);

    std::string cleaned = normalization::trim_edges(stripped.remainder);
    if (normalization::code_point_count(cleaned) < options.min_length) {
        spdlog::debug("[analyze_release] '{}' leaves '{}', shorter than {} characters",
                      subfilename, cleaned, options.min_length);
        return analysis;
    }

    analysis.release = std::move(cleaned);
    return analysis;
}

std::optional<std::string> get_release_from_sub_filename(
    std::string_view subfilename,
    const language::LanguageTable& table,
    bool release_name_mode) {
    ReleaseOptions options = default_release_options();
    options.release_name_mode = release_name_mode;
    return get_release_from_sub_filename(subfilename, table, options);
}

std::optional<std::string> get_release_from_sub_filename(
    std::string_view subfilename,
    const language::LanguageTable& table,
    const ReleaseOptions& options) {
    auto analysis = analyze_release(subfilename, table, options);
    if (!analysis.release) {
        return std::nullopt;
    }
    return " " + *analysis.release;
}

std::string clean_release_name(std::string_view subfilename, const language::LanguageTable& table) {
    return clean_release_name(subfilename, table, default_release_options());
}

std::string clean_release_name(
    std::string_view subfilename,
    const language::LanguageTable& table,
    const ReleaseOptions& options) {
    auto raw = get_release_from_sub_filename(subfilename, table, options);
    if (!raw) {
        return std::string(subfilename);
    }
    return normalization::trim(*raw);
}

}  // namespace release
}  // namespace subrelease
