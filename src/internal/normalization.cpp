#include <subrelease/internal/normalization.hpp>

#include <algorithm>
#include <cctype>

#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace subrelease {
namespace normalization {

namespace {

icu::UnicodeString to_unicode(std::string_view str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(str.data(), static_cast<int32_t>(str.size())));
}

// UTF-8 continuation bytes look like 10xxxxxx
bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::string to_lower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    const auto end = str.find_last_not_of(" \t\n\r");
    return std::string(str.substr(start, end - start + 1));
}

std::string trim_edges(std::string_view str) {
    auto is_edge = [](char c) {
        return is_separator(c) || kEdgeCharacters.find(c) != std::string_view::npos ||
               std::isspace(static_cast<unsigned char>(c));
    };

    std::size_t start = 0;
    while (start < str.size() && is_edge(str[start])) {
        ++start;
    }
    std::size_t end = str.size();
    while (end > start && is_edge(str[end - 1])) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::size_t trailing_separator_count(std::string_view str) noexcept {
    std::size_t count = 0;
    while (count < str.size() && is_separator(str[str.size() - count - 1])) {
        ++count;
    }
    return count;
}

std::string fold_case(std::string_view str) {
    if (!has_non_ascii(str)) {
        return to_lower(str);
    }
    icu::UnicodeString ustr = to_unicode(str);
    ustr.foldCase();
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

bool iequals(std::string_view s1, std::string_view s2) {
    if (!has_non_ascii(s1) && !has_non_ascii(s2)) {
        return s1.size() == s2.size() && to_lower(s1) == to_lower(s2);
    }
    return to_unicode(s1).caseCompare(to_unicode(s2), U_FOLD_CASE_DEFAULT) == 0;
}

bool ends_with_icase(std::string_view str, std::string_view suffix) {
    if (suffix.empty() || suffix.size() > str.size()) {
        return false;
    }
    std::string_view tail = str.substr(str.size() - suffix.size());
    if (is_continuation_byte(tail.front())) {
        return false;
    }
    return iequals(tail, suffix);
}

std::size_t code_point_count(std::string_view str) {
    if (!has_non_ascii(str)) {
        return str.size();
    }
    return static_cast<std::size_t>(to_unicode(str).countChar32());
}

bool has_non_ascii(std::string_view str) {
    return std::any_of(
        str.begin(), str.end(), [](unsigned char c) { return c > 127; });
}

}  // namespace normalization
}  // namespace subrelease
