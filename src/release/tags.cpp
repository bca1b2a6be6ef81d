#include <subrelease/internal/normalization.hpp>
#include <subrelease/release/tags.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace subrelease {
namespace release {

namespace {

bool is_ascii_alpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// A tag of tag_length bytes at the end of body starts right after a separator
bool preceded_by_separator(std::string_view body, std::size_t tag_length) {
    return tag_length < body.size() &&
           normalization::is_separator(body[body.size() - tag_length - 1]);
}

// Adds a term unless an equal one (ignoring case) is already present
void add_term(std::vector<VocabularyTerm>& terms, std::set<std::string>& seen,
              const std::string& text, const std::string& key) {
    if (text.empty()) {
        return;
    }
    if (seen.insert(normalization::fold_case(text)).second) {
        terms.push_back(VocabularyTerm{.text = text, .language_key = key});
    }
}

void sort_longest_first(std::vector<VocabularyTerm>& terms) {
    std::stable_sort(terms.begin(), terms.end(),
                     [](const VocabularyTerm& a, const VocabularyTerm& b) {
                         return a.text.size() > b.text.size();
                     });
}

// First term found at the end of body behind a separator
std::optional<TagMatch> match_terms(std::string_view body,
                                    const std::vector<VocabularyTerm>& terms, TagKind kind) {
    for (const auto& term : terms) {
        if (normalization::ends_with_icase(body, term.text) &&
            preceded_by_separator(body, term.text.size())) {
            return TagMatch{.length = term.text.size(),
                            .replacement = "",
                            .kind = kind,
                            .language_key = term.language_key};
        }
    }
    return std::nullopt;
}

}  // namespace

std::string to_string(TagKind kind) {
    switch (kind) {
    case TagKind::HearingImpaired:
        return "hearing_impaired";
    case TagKind::Disc:
        return "disc";
    case TagKind::RegionalLanguage:
        return "regional_language";
    case TagKind::LanguageCode:
        return "language_code";
    case TagKind::LanguageName:
        return "language_name";
    }
    return "unknown";
}

TagVocabulary build_vocabulary(
    const language::LanguageTable& table, const ReleaseOptions& options) {
    TagVocabulary vocabulary;
    std::set<std::string> seen_codes;
    std::set<std::string> seen_two_letter;
    std::set<std::string> seen_names;

    for (const auto& [key, entry] : table) {
        for (const auto* code : {&entry.language_code, &entry.iso639, &entry.iso639_3}) {
            if (code->size() == 2 || code->size() == 3) {
                add_term(vocabulary.short_codes, seen_codes, *code, key);
            }
        }
        if (entry.language_code.size() == 2) {
            add_term(vocabulary.two_letter_codes, seen_two_letter, entry.language_code, key);
        }
        for (const auto* name :
             {&entry.language_name, &entry.display_name, &entry.original_name}) {
            add_term(vocabulary.full_names, seen_names, *name, key);
        }
    }

    for (const auto& code : options.extra_codes) {
        const auto* entry = language::find_by_code(table, code);
        add_term(vocabulary.short_codes, seen_codes, code, entry ? entry->key : "");
    }
    for (const auto& name : options.extra_names) {
        const auto* entry = language::find_by_name(table, name);
        add_term(vocabulary.full_names, seen_names, name, entry ? entry->key : "");
    }

    sort_longest_first(vocabulary.short_codes);
    sort_longest_first(vocabulary.two_letter_codes);
    sort_longest_first(vocabulary.full_names);
    return vocabulary;
}

std::optional<TagMatch> match_hearing_impaired(
    std::string_view body, const TagVocabulary& /*vocabulary*/) {
    constexpr std::string_view kMarker = "sdh";
    if (normalization::ends_with_icase(body, kMarker) &&
        preceded_by_separator(body, kMarker.size())) {
        return TagMatch{.length = kMarker.size(), .replacement = "",
                        .kind = TagKind::HearingImpaired, .language_key = ""};
    }
    return std::nullopt;
}

std::optional<TagMatch> match_disc(std::string_view body, const TagVocabulary& /*vocabulary*/) {
    if (body.size() < 3) {
        return std::nullopt;
    }

    const char number = body.back();
    if (!std::isdigit(static_cast<unsigned char>(number)) && number != 'I' && number != 'i') {
        return std::nullopt;
    }

    // "CD1" or "CD 1"
    std::size_t length = 1;
    if (body.size() >= 4 && body[body.size() - 2] == ' ') {
        ++length;
    }
    std::string_view prefix = body.substr(0, body.size() - length);
    if (!normalization::ends_with_icase(prefix, "cd")) {
        return std::nullopt;
    }
    length += 2;

    if (!preceded_by_separator(body, length)) {
        return std::nullopt;
    }
    return TagMatch{.length = length, .replacement = "", .kind = TagKind::Disc,
                    .language_key = ""};
}

std::optional<TagMatch> match_regional_language(
    std::string_view body, const TagVocabulary& vocabulary) {
    constexpr std::size_t kLength = 5;  // "pt-BR"
    if (body.size() <= kLength) {
        return std::nullopt;
    }

    std::string_view tag = body.substr(body.size() - kLength);
    if (tag[2] != '-' || !is_ascii_alpha(tag[3]) || !is_ascii_alpha(tag[4])) {
        return std::nullopt;
    }
    if (!preceded_by_separator(body, kLength)) {
        return std::nullopt;
    }

    std::string_view code = tag.substr(0, 2);
    for (const auto& term : vocabulary.two_letter_codes) {
        if (normalization::iequals(term.text, code)) {
            return TagMatch{.length = kLength, .replacement = "",
                            .kind = TagKind::RegionalLanguage, .language_key = term.language_key};
        }
    }
    return std::nullopt;
}

std::optional<TagMatch> match_language_code(
    std::string_view body, const TagVocabulary& vocabulary) {
    return match_terms(body, vocabulary.short_codes, TagKind::LanguageCode);
}

std::optional<TagMatch> match_language_name(
    std::string_view body, const TagVocabulary& vocabulary) {
    return match_terms(body, vocabulary.full_names, TagKind::LanguageName);
}

const std::vector<TagMatcher>& default_tag_matchers() {
    static const std::vector<TagMatcher> kMatchers = {
        match_hearing_impaired,
        match_disc,
        match_regional_language,
        match_language_code,
        match_language_name,
    };
    return kMatchers;
}

StripResult strip_trailing_tags(
    std::string_view working,
    const TagVocabulary& vocabulary,
    const std::vector<TagMatcher>& matchers) {
    StripResult result;
    std::string current(working);

    while (true) {
        current.resize(current.size() - normalization::trailing_separator_count(current));

        std::optional<TagMatch> match;
        for (const auto& matcher : matchers) {
            match = matcher(current, vocabulary);
            if (match) {
                break;
            }
        }
        if (!match) {
            break;
        }
        if (match->length == 0 || match->length > current.size()) {
            spdlog::warn("[strip_trailing_tags] matcher reported {} bytes for '{}', stopping",
                         match->length, current);
            break;
        }

        const std::size_t tag_start = current.size() - match->length;
        std::size_t cut = tag_start;
        while (cut > 0 && normalization::is_separator(current[cut - 1])) {
            --cut;
        }

        std::string next = current.substr(0, cut) + match->replacement;
        if (next.size() >= current.size()) {
            spdlog::warn("[strip_trailing_tags] replacement does not shorten '{}', stopping",
                         current);
            break;
        }

        spdlog::debug("[strip_trailing_tags] removed {} '{}' from '{}'", to_string(match->kind),
                      current.substr(tag_start), current);
        result.tags.push_back(StrippedTag{.kind = match->kind,
                                          .text = current.substr(tag_start),
                                          .language_key = match->language_key});
        current = std::move(next);
    }

    result.remainder = std::move(current);
    return result;
}

}  // namespace release
}  // namespace subrelease
