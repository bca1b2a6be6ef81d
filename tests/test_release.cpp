// Tests for release-name extraction
#include <gtest/gtest.h>

#include <subrelease/config.hpp>
#include <subrelease/filename/filename.hpp>
#include <subrelease/release/release.hpp>

#include "testutil/loader.hpp"

using namespace subrelease;
using namespace subrelease::testutil;
using namespace subrelease::release;

namespace {

// Built during static initialization, before main
const ReleaseOptions kStaticOptions;
const Config kStaticConfig = default_config();

}  // namespace

class ReleaseTest : public ::testing::Test {
  protected:
    void SetUp() override {
        loader_ = std::make_unique<Loader>(Loader::from_compile_definition());
        table_ = loader_->language_table();
    }

    std::unique_ptr<Loader> loader_;
    language::LanguageTable table_;
};

// Test get_release_from_sub_filename using shared test data
TEST_F(ReleaseTest, GetReleaseFromSubFilename) {
    auto test_cases = loader_->get_test_cases("release", "get_release_from_sub_filename");
    ASSERT_FALSE(test_cases.empty()) << "No test cases loaded";

    for (const auto& tc : test_cases) {
        auto filename = tc.input_get<std::string>("filename");
        auto release_name_mode = tc.input_get<bool>("release_name_mode", false);
        auto result = get_release_from_sub_filename(filename, table_, release_name_mode);

        if (tc.is_expected_null()) {
            EXPECT_FALSE(result.has_value())
                << "Test case: " << tc.id << " - expected no release but got '"
                << result.value_or("") << "'";
        } else {
            ASSERT_TRUE(result.has_value()) << "Test case: " << tc.id << " - " << tc.description;
            EXPECT_EQ(*result, tc.expected_string())
                << "Test case: " << tc.id << " - " << tc.description;
        }
    }
}

// Test clean_release_name using shared test data
TEST_F(ReleaseTest, CleanReleaseName) {
    auto test_cases = loader_->get_test_cases("release", "clean_release_name");
    ASSERT_FALSE(test_cases.empty()) << "No test cases loaded";

    for (const auto& tc : test_cases) {
        auto input = tc.input_string();
        auto result = clean_release_name(input, table_);
        EXPECT_EQ(result, tc.expected_string()) << "Test case: " << tc.id << " - " << tc.description;
    }
}

TEST_F(ReleaseTest, RawResultAlwaysStartsWithOneSpace) {
    for (const char* name : {"Movie.Name.2024.eng.srt", "English.Patient.2024.srt",
                             "Movie.Name.CD1.eng.srt", " Movie.Name.eng.srt"}) {
        auto result = get_release_from_sub_filename(name, table_);
        ASSERT_TRUE(result.has_value()) << name;
        ASSERT_GE(result->size(), 2u);
        EXPECT_EQ((*result)[0], ' ') << name;
        EXPECT_NE((*result)[1], ' ') << name;
    }
}

TEST_F(ReleaseTest, WrapperNeverReturnsLeadingSpace) {
    for (const char* name : {"Movie.Name.2024.eng.srt", "ab", "English.Patient.2024.srt",
                             "Movie.Name.pt-BR.srt", "x"}) {
        auto result = clean_release_name(name, table_);
        ASSERT_FALSE(result.empty()) << name;
        EXPECT_NE(result.front(), ' ') << name;
    }
}

TEST_F(ReleaseTest, WrapperIsIdempotentOnCleanNames) {
    for (const char* name : {"Movie.Name.2024", "The.Movie.Name.2024.1080p.BluRay.x264",
                             "English.Patient.2024"}) {
        auto once = clean_release_name(name, table_);
        EXPECT_EQ(once, name);
        EXPECT_EQ(clean_release_name(once, table_), once);
    }
}

TEST_F(ReleaseTest, SameInputSameOutput) {
    const std::string name = "Movie.Name.2024.en-US.sdh.srt";
    auto first = get_release_from_sub_filename(name, table_);
    auto second = get_release_from_sub_filename(name, table_);
    EXPECT_EQ(first, second);
}

TEST_F(ReleaseTest, EmptyTableStillStripsDiscAndSdh) {
    language::LanguageTable empty;
    ReleaseOptions options = default_release_options();
    options.extra_codes.clear();
    options.extra_names.clear();

    auto result = get_release_from_sub_filename("Movie.Name.CD1.sdh.srt", empty, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, " Movie.Name");

    result = get_release_from_sub_filename("Movie.Name.eng.srt", empty, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, " Movie.Name.eng");
}

TEST_F(ReleaseTest, MinLengthOption) {
    ReleaseOptions options = default_release_options();
    options.min_length = 6;
    EXPECT_FALSE(get_release_from_sub_filename("Movie.eng.srt", table_, options).has_value());

    options.min_length = 5;
    auto result = get_release_from_sub_filename("Movie.eng.srt", table_, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, " Movie");
}

TEST_F(ReleaseTest, MinLengthCountsCharactersNotBytes) {
    // "Été" is three characters but five bytes
    auto result = get_release_from_sub_filename("Été.eng.srt", table_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, " Été");

    ReleaseOptions options = default_release_options();
    options.min_length = 4;
    EXPECT_FALSE(get_release_from_sub_filename("Été.eng.srt", table_, options).has_value());
}

TEST_F(ReleaseTest, CustomSubtitleExtensions) {
    ReleaseOptions options = default_release_options();
    options.subtitle_extensions = {"ass"};

    auto result = get_release_from_sub_filename("Movie.Name.eng.srt", table_, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, " Movie.Name.eng.srt");

    result = get_release_from_sub_filename("Movie.Name.eng.ASS", table_, options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, " Movie.Name");
}

TEST_F(ReleaseTest, AnalyzeReportsStrippedTags) {
    auto analysis = analyze_release("Movie.Name.CD1.pt-BR.sdh.srt", table_);

    ASSERT_TRUE(analysis.found());
    EXPECT_EQ(*analysis.release, "Movie.Name");
    EXPECT_EQ(analysis.original, "Movie.Name.CD1.pt-BR.sdh.srt");
    EXPECT_EQ(analysis.extension, "srt");
    EXPECT_TRUE(analysis.hearing_impaired);
    EXPECT_EQ(analysis.disc, "CD1");
    EXPECT_EQ(analysis.languages, std::vector<std::string>{"pt"});

    ASSERT_EQ(analysis.stripped_tags.size(), 3u);
    EXPECT_EQ(analysis.stripped_tags[0].kind, TagKind::HearingImpaired);
    EXPECT_EQ(analysis.stripped_tags[0].text, "sdh");
    EXPECT_EQ(analysis.stripped_tags[1].kind, TagKind::RegionalLanguage);
    EXPECT_EQ(analysis.stripped_tags[1].text, "pt-BR");
    EXPECT_EQ(analysis.stripped_tags[2].kind, TagKind::Disc);
    EXPECT_EQ(analysis.stripped_tags[2].text, "CD1");
}

TEST_F(ReleaseTest, AnalyzeCollectsLanguagesRightmostFirst) {
    auto analysis = analyze_release("Movie.Name.French.spa.eng.srt", table_);

    ASSERT_TRUE(analysis.found());
    EXPECT_EQ(*analysis.release, "Movie.Name");
    EXPECT_EQ(analysis.languages, (std::vector<std::string>{"en", "es", "fr"}));
    EXPECT_FALSE(analysis.hearing_impaired);
    EXPECT_TRUE(analysis.disc.empty());
}

TEST_F(ReleaseTest, AnalyzeKeepsTagsWhenTooShort) {
    auto analysis = analyze_release("ab.eng.srt", table_);

    EXPECT_FALSE(analysis.found());
    EXPECT_EQ(analysis.languages, std::vector<std::string>{"en"});
    EXPECT_EQ(analysis.extension, "srt");
}

TEST_F(ReleaseTest, AnalyzeReleaseModeHasNoExtension) {
    ReleaseOptions options = default_release_options();
    options.release_name_mode = true;
    auto analysis = analyze_release("Movie.Name.eng", table_, options);

    ASSERT_TRUE(analysis.found());
    EXPECT_EQ(*analysis.release, "Movie.Name");
    EXPECT_TRUE(analysis.extension.empty());
}

TEST_F(ReleaseTest, BuiltinTableNativeNames) {
    const auto& table = language::builtin_language_table();

    EXPECT_EQ(clean_release_name("Filme.Nome.2020.Português.srt", table), "Filme.Nome.2020");
    EXPECT_EQ(clean_release_name("Filme.Nome.2020.PORTUGUÊS.srt", table), "Filme.Nome.2020");
    EXPECT_EQ(clean_release_name("Film.Name.2020.Deutsch.srt", table), "Film.Name.2020");
    EXPECT_EQ(clean_release_name("Film.Name.2020.ger.srt", table), "Film.Name.2020");
    EXPECT_EQ(clean_release_name("Film.Name.2020.deu.srt", table), "Film.Name.2020");

    auto analysis = analyze_release("Film.Name.2020.Portuguese (BR).srt", table);
    ASSERT_TRUE(analysis.found());
    EXPECT_EQ(*analysis.release, "Film.Name.2020");
    EXPECT_EQ(analysis.languages, std::vector<std::string>{"pb"});
}

TEST_F(ReleaseTest, OptionsBuiltAtNamespaceScopeKeepExtensions) {
    EXPECT_EQ(kStaticOptions.subtitle_extensions, filename::subtitle_extensions());
    EXPECT_EQ(kStaticConfig.release.subtitle_extensions, filename::subtitle_extensions());

    EXPECT_EQ(clean_release_name("Movie.Name.2024.eng.srt", table_, kStaticOptions),
              "Movie.Name.2024");
    EXPECT_EQ(clean_release_name("Movie.Name.2024.eng.srt", table_, kStaticConfig.release),
              "Movie.Name.2024");
}
