// Tests for release-name similarity and subtitle/video pairing
#include <gtest/gtest.h>

#include <subrelease/matching/matching.hpp>

#include "testutil/loader.hpp"

using namespace subrelease;
using namespace subrelease::testutil;
using namespace subrelease::matching;

class MatchingTest : public ::testing::Test {
  protected:
    void SetUp() override {
        loader_ = std::make_unique<Loader>(Loader::from_compile_definition());
        table_ = loader_->language_table();
    }

    std::unique_ptr<Loader> loader_;
    language::LanguageTable table_;
};

TEST_F(MatchingTest, NormalizeReleaseKey) {
    EXPECT_EQ(normalize_release_key("Movie.Name_2024"), "movie name 2024");
    EXPECT_EQ(normalize_release_key(" .Movie..Name. "), "movie name");
    EXPECT_EQ(normalize_release_key("WEB-DL"), "web dl");
    EXPECT_EQ(normalize_release_key(""), "");
}

TEST_F(MatchingTest, Similarity) {
    EXPECT_DOUBLE_EQ(similarity("Movie.Name.2024", "movie name 2024"), 1.0);
    EXPECT_DOUBLE_EQ(similarity("abc", "xyz"), 0.0);

    double score = similarity("Movie.Name.2024.1080p", "Movie.Name.2024.720p");
    EXPECT_GT(score, 0.8);
    EXPECT_LT(score, 1.0);
}

TEST_F(MatchingTest, FindBestMatch) {
    std::vector<std::string> candidates = {"Other.Film.1999", "Movie.Name.2024.1080p",
                                           "Movie.Name.2024.720p"};

    auto result = find_best_match("Movie Name 2024 1080p", candidates);
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.match, "Movie.Name.2024.1080p");
    EXPECT_EQ(result.index, 1u);
    EXPECT_DOUBLE_EQ(result.score, 1.0);

    EXPECT_FALSE(find_best_match("Completely.Different", {"Movie.Name.2024"}).found());
    EXPECT_FALSE(find_best_match("Movie.Name", {}).found());
}

TEST_F(MatchingTest, FindBestMatchThreshold) {
    std::vector<std::string> candidates = {"Movie.Name.2024.720p"};

    EXPECT_TRUE(find_best_match("Movie.Name.2024.1080p", candidates).found());
    EXPECT_FALSE(
        find_best_match("Movie.Name.2024.1080p", candidates, MatchOptions{.min_similarity = 1.0})
            .found());
}

TEST_F(MatchingTest, MatchConfidence) {
    EXPECT_EQ(match_confidence("Movie.Name.2024", "movie_name_2024"), MatchConfidence::Exact);
    EXPECT_EQ(match_confidence("Movie.Name.2024.1080p.BluRay.x264",
                               "Movie.Name.2024.1080p.BluRay.x265"),
              MatchConfidence::High);
    EXPECT_EQ(match_confidence("abc", "xyz"), MatchConfidence::None);

    EXPECT_EQ(to_string(MatchConfidence::Exact), "exact");
    EXPECT_EQ(to_string(MatchConfidence::High), "high");
    EXPECT_EQ(to_string(MatchConfidence::Medium), "medium");
    EXPECT_EQ(to_string(MatchConfidence::Low), "low");
    EXPECT_EQ(to_string(MatchConfidence::None), "none");
}

TEST_F(MatchingTest, PairSubtitles) {
    std::vector<std::string> videos = {
        "/movies/Movie.Name.2024.1080p.BluRay.x264.mkv",
        "/movies/Other.Film.1999.DVDRip.avi",
        "/movies/Lonely.Video.mkv",
        "/movies/notes.txt",
    };
    std::vector<std::string> subtitles = {
        "Movie.Name.2024.1080p.BluRay.x264.eng.srt",
        "/subs/Movie.Name.2024.1080p.BluRay.x264.pt-BR.sdh.srt",
        "Other.Film.1999.DVDRip.CD1.spa.srt",
        "Unrelated.Show.S01E01.srt",
        "cover.jpg",
    };

    auto result = pair_subtitles(videos, subtitles, table_);

    ASSERT_EQ(result.pairs.size(), 2u);

    EXPECT_EQ(result.pairs[0].video, videos[0]);
    ASSERT_EQ(result.pairs[0].subtitles.size(), 2u);
    EXPECT_EQ(result.pairs[0].subtitles[0].filename, subtitles[0]);
    EXPECT_EQ(result.pairs[0].subtitles[0].release, "Movie.Name.2024.1080p.BluRay.x264");
    EXPECT_DOUBLE_EQ(result.pairs[0].subtitles[0].score, 1.0);
    EXPECT_EQ(result.pairs[0].subtitles[0].confidence, MatchConfidence::Exact);
    EXPECT_EQ(result.pairs[0].subtitles[1].filename, subtitles[1]);

    EXPECT_EQ(result.pairs[1].video, videos[1]);
    ASSERT_EQ(result.pairs[1].subtitles.size(), 1u);
    EXPECT_EQ(result.pairs[1].subtitles[0].release, "Other.Film.1999.DVDRip");

    EXPECT_EQ(result.unmatched_subtitles, std::vector<std::string>{"Unrelated.Show.S01E01.srt"});
}

TEST_F(MatchingTest, PairSubtitlesFuzzy) {
    std::vector<std::string> videos = {"Movie.Name.2024.1080p.BluRay.x264.mkv"};
    std::vector<std::string> subtitles = {"Movie.Name.2024.1080p.BluRay.x264-GRP.eng.srt"};

    auto result = pair_subtitles(videos, subtitles, table_);
    ASSERT_EQ(result.pairs.size(), 1u);
    ASSERT_EQ(result.pairs[0].subtitles.size(), 1u);
    EXPECT_GT(result.pairs[0].subtitles[0].score, 0.9);
    EXPECT_LT(result.pairs[0].subtitles[0].score, 1.0);
    EXPECT_EQ(result.pairs[0].subtitles[0].confidence, MatchConfidence::Medium);

    auto strict = pair_subtitles(videos, subtitles, table_, make_config({with_min_similarity(1.0)}));
    EXPECT_TRUE(strict.pairs.empty());
    EXPECT_EQ(strict.unmatched_subtitles, subtitles);
}

TEST_F(MatchingTest, PairSubtitlesNoVideos) {
    auto result = pair_subtitles({}, {"Movie.Name.eng.srt"}, table_);
    EXPECT_TRUE(result.pairs.empty());
    EXPECT_EQ(result.unmatched_subtitles, std::vector<std::string>{"Movie.Name.eng.srt"});
}
