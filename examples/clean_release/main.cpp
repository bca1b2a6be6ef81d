// Example: Release Name Extraction
//
// This example demonstrates how to recover the release name from subtitle
// filenames, and what the engine learns about each file along the way.
//
// To run:
//   ./clean_release [languages.json]

#include <iostream>
#include <string>
#include <vector>

#include <subrelease/errors.hpp>
#include <subrelease/language/language.hpp>
#include <subrelease/release/release.hpp>

int main(int argc, char* argv[]) {
    using namespace subrelease;
    using namespace subrelease::release;

    language::LanguageTable table;
    try {
        table = argc > 1 ? language::load_language_table(argv[1])
                         : language::builtin_language_table();
    } catch (const LanguageTableError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Example subtitle filenames
    std::vector<std::string> examples = {
        "Movie.Name.2024.1080p.BluRay.x264.eng.srt",
        "Movie.Name.2024.1080p.BluRay.x264.CD1.eng.sdh.srt",
        "Prisoner.of.War.2025.1080p.AMZN.WEB-DL.DDP5.1.H.264.v2.pt-PT.srt",
        "Le.Film.2019.720p.WEB.Français.ass",
        "English.Patient.1996.DVDRip.spanish.srt",
        "ab.eng.srt",
    };

    for (const auto& subtitle : examples) {
        std::cout << "Filename: " << subtitle << "\n";
        std::cout << "------------------------------------------------\n";

        // Raw extractor keeps its leading space
        auto raw = get_release_from_sub_filename(subtitle, table);
        if (raw) {
            std::cout << "  Raw:       \"" << *raw << "\"\n";
        } else {
            std::cout << "  Raw:       (not found)\n";
        }

        // Convenience wrapper never fails
        std::cout << "  Cleaned:   " << clean_release_name(subtitle, table) << "\n";

        auto analysis = analyze_release(subtitle, table);
        if (!analysis.languages.empty()) {
            std::cout << "  Languages: [";
            for (size_t i = 0; i < analysis.languages.size(); ++i) {
                if (i > 0) std::cout << ", ";
                std::cout << "\"" << table.at(analysis.languages[i]).display_name << "\"";
            }
            std::cout << "]\n";
        }
        if (!analysis.disc.empty()) {
            std::cout << "  Disc: " << analysis.disc << "\n";
        }
        if (analysis.hearing_impaired) {
            std::cout << "  Note: hearing impaired\n";
        }

        std::cout << "\n";
    }

    return 0;
}
