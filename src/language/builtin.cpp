#include <subrelease/language/language.hpp>

namespace subrelease {
namespace language {

namespace {

LanguageTable make_builtin_table() {
    // key, iso639, language_code, iso639_3, language_name, display_name, original_name
    const LanguageEntry entries[] = {
        {"ar", "ara", "ar", "ara", "Arabic", "Arabic", "العربية"},
        {"bg", "bul", "bg", "bul", "Bulgarian", "Bulgarian", "Български"},
        {"ca", "cat", "ca", "cat", "Catalan", "Catalan", "Català"},
        {"cs", "cze", "cs", "ces", "Czech", "Czech", "Čeština"},
        {"da", "dan", "da", "dan", "Danish", "Danish", "Dansk"},
        {"de", "ger", "de", "deu", "German", "German", "Deutsch"},
        {"el", "gre", "el", "ell", "Greek", "Greek", "Ελληνικά"},
        {"en", "eng", "en", "eng", "English", "English", "English"},
        {"es", "spa", "es", "spa", "Spanish", "Spanish", "Español"},
        {"et", "est", "et", "est", "Estonian", "Estonian", "Eesti"},
        {"fa", "per", "fa", "fas", "Persian", "Persian", "فارسی"},
        {"fi", "fin", "fi", "fin", "Finnish", "Finnish", "Suomi"},
        {"fr", "fre", "fr", "fra", "French", "French", "Français"},
        {"he", "heb", "he", "heb", "Hebrew", "Hebrew", "עברית"},
        {"hr", "hrv", "hr", "hrv", "Croatian", "Croatian", "Hrvatski"},
        {"hu", "hun", "hu", "hun", "Hungarian", "Hungarian", "Magyar"},
        {"id", "ind", "id", "ind", "Indonesian", "Indonesian", "Bahasa Indonesia"},
        {"it", "ita", "it", "ita", "Italian", "Italian", "Italiano"},
        {"ja", "jpn", "ja", "jpn", "Japanese", "Japanese", "日本語"},
        {"ko", "kor", "ko", "kor", "Korean", "Korean", "한국어"},
        {"lt", "lit", "lt", "lit", "Lithuanian", "Lithuanian", "Lietuvių"},
        {"lv", "lav", "lv", "lav", "Latvian", "Latvian", "Latviešu"},
        {"nl", "dut", "nl", "nld", "Dutch", "Dutch", "Nederlands"},
        {"no", "nor", "no", "nor", "Norwegian", "Norwegian", "Norsk"},
        {"pb", "pob", "pb", "", "Portuguese (BR)", "Portuguese (Brazil)", "Português (Brasil)"},
        {"pl", "pol", "pl", "pol", "Polish", "Polish", "Polski"},
        {"pt", "por", "pt", "por", "Portuguese", "Portuguese", "Português"},
        {"ro", "rum", "ro", "ron", "Romanian", "Romanian", "Română"},
        {"ru", "rus", "ru", "rus", "Russian", "Russian", "Русский"},
        {"sk", "slo", "sk", "slk", "Slovak", "Slovak", "Slovenčina"},
        {"sl", "slv", "sl", "slv", "Slovenian", "Slovenian", "Slovenščina"},
        {"sr", "scc", "sr", "srp", "Serbian", "Serbian", "Српски"},
        {"sv", "swe", "sv", "swe", "Swedish", "Swedish", "Svenska"},
        {"th", "tha", "th", "tha", "Thai", "Thai", "ไทย"},
        {"tr", "tur", "tr", "tur", "Turkish", "Turkish", "Türkçe"},
        {"uk", "ukr", "uk", "ukr", "Ukrainian", "Ukrainian", "Українська"},
        {"vi", "vie", "vi", "vie", "Vietnamese", "Vietnamese", "Tiếng Việt"},
        {"zh", "chi", "zh", "zho", "Chinese", "Chinese (simplified)", "中文"},
    };

    LanguageTable table;
    for (const auto& entry : entries) {
        table.emplace(entry.key, entry);
    }
    return table;
}

}  // namespace

const LanguageTable& builtin_language_table() {
    static const LanguageTable kTable = make_builtin_table();
    return kTable;
}

}  // namespace language
}  // namespace subrelease
