/*
 * test_suggestion_history.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for the suggestion outcome ledger

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "history/suggestion_history.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace curator::history;
using curator::model::Recommendation;
using curator::model::TimePoint;
using namespace std::chrono_literals;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class SuggestionHistoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = TimePoint{} + std::chrono::hours(24 * 365 * 50);
        dir_ = std::filesystem::temp_directory_path() /
               ("curator_history_" +
                std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()
                          ->current_test_info()
                          ->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    auto makeHistory(std::filesystem::path file = {})
        -> std::unique_ptr<SuggestionHistory> {
        HistoryOptions options;
        options.filePath = std::move(file);
        return std::make_unique<SuggestionHistory>(
            options, [this] { return now_; });
    }

    static auto rec(std::string artist, std::string album) -> Recommendation {
        Recommendation r;
        r.artist = std::move(artist);
        r.album = std::move(album);
        r.confidence = 0.8;
        return r;
    }

    void advance(std::chrono::milliseconds by) { now_ += by; }

    TimePoint now_;
    std::filesystem::path dir_;
};

// ============================================================================
// Outcome Gating
// ============================================================================

TEST_F(SuggestionHistoryTest, OutcomeTooSoonAfterSuggestionIsIgnored) {
    auto history = makeHistory();
    history->recordSuggestions({rec("Yes", "Fragile")});

    advance(200ms);
    EXPECT_FALSE(history->recordRejected("Yes", "Fragile"));
    EXPECT_FALSE(history->wasRejectedOrDisliked("Yes", "Fragile"));

    advance(2s);
    EXPECT_TRUE(history->recordRejected("Yes", "Fragile", "not my taste"));
    EXPECT_TRUE(history->wasRejectedOrDisliked("Yes", "Fragile"));
}

TEST_F(SuggestionHistoryTest, AcceptedIsNeverGated) {
    auto history = makeHistory();
    history->recordSuggestions({rec("Yes", "Fragile")});
    EXPECT_TRUE(history->recordAccepted("Yes", "Fragile"));
}

TEST_F(SuggestionHistoryTest, OutcomeWithoutSuggestionIsRecorded) {
    auto history = makeHistory();
    EXPECT_TRUE(history->recordDisliked("Nickelback", ""));
    EXPECT_TRUE(history->wasRejectedOrDisliked("nickelback", ""));
}

// ============================================================================
// Exclusion Rules
// ============================================================================

TEST_F(SuggestionHistoryTest, RejectionExpiresAfterMemoryWindow) {
    auto history = makeHistory();
    ASSERT_TRUE(history->recordRejected("Yes", "Tormato"));
    EXPECT_TRUE(history->wasRejectedOrDisliked("Yes", "Tormato"));

    advance(std::chrono::hours(24 * 31));
    EXPECT_FALSE(history->wasRejectedOrDisliked("Yes", "Tormato"));
}

TEST_F(SuggestionHistoryTest, DislikeIsPermanent) {
    auto history = makeHistory();
    ASSERT_TRUE(history->recordDisliked("Yes", "Tormato"));
    advance(std::chrono::hours(24 * 365));
    EXPECT_TRUE(history->wasRejectedOrDisliked("Yes", "Tormato"));

    // A later acceptance does not lift a dislike.
    ASSERT_TRUE(history->recordAccepted("Yes", "Tormato"));
    EXPECT_TRUE(history->wasRejectedOrDisliked("Yes", "Tormato"));
}

TEST_F(SuggestionHistoryTest, AcceptanceSupersedesRejection) {
    auto history = makeHistory();
    ASSERT_TRUE(history->recordRejected("Yes", "Drama"));
    advance(1h);
    ASSERT_TRUE(history->recordAccepted("Yes", "Drama"));
    EXPECT_FALSE(history->wasRejectedOrDisliked("Yes", "Drama"));
}

TEST_F(SuggestionHistoryTest, KeysAreCaseAndWhitespaceInsensitive) {
    auto history = makeHistory();
    ASSERT_TRUE(history->recordDisliked("  The Beatles ", "Help!"));
    EXPECT_TRUE(history->wasRejectedOrDisliked("the beatles", "HELP!"));
}

TEST_F(SuggestionHistoryTest, ExclusionsByCategory) {
    auto history = makeHistory();
    history->recordSuggestions({rec("Camel", "Moonmadness")});
    history->recordSuggestions({rec("Camel", "Moonmadness")});
    history->recordSuggestions({rec("Camel", "Moonmadness")});
    advance(5s);
    ASSERT_TRUE(history->recordAccepted("Genesis", "Foxtrot"));
    ASSERT_TRUE(history->recordRejected("Yes", "Drama"));
    ASSERT_TRUE(history->recordDisliked("Asia", "Astra"));

    auto exclusions = history->exclusions();
    EXPECT_THAT(exclusions.libraryArtists, ElementsAre("Genesis"));
    EXPECT_THAT(exclusions.recentlyRejected, ElementsAre("Yes|Drama"));
    EXPECT_THAT(exclusions.disliked, ElementsAre("Asia|Astra"));
    EXPECT_THAT(exclusions.overSuggested, ElementsAre("Camel|Moonmadness"));
    EXPECT_EQ(history->suggestionCount("camel", "moonmadness"), 3u);
}

TEST_F(SuggestionHistoryTest, ExclusionPromptListsExcludeAndAvoid) {
    auto history = makeHistory();
    ASSERT_TRUE(history->recordAccepted("Genesis", "Foxtrot"));
    ASSERT_TRUE(history->recordDisliked("Asia", "Astra"));

    auto prompt = history->exclusionPrompt();
    EXPECT_THAT(prompt, HasSubstr("EXCLUDE:Genesis"));
    EXPECT_THAT(prompt, HasSubstr("AVOID:Asia"));
}

TEST(FormatExclusionPromptTest, EmptyExclusionsGiveEmptyPrompt) {
    EXPECT_TRUE(formatExclusionPrompt(HistoryExclusions{}).empty());
}

TEST(FormatExclusionPromptTest, ListsAreCapped) {
    HistoryExclusions exclusions;
    exclusions.libraryArtists = {"A", "B", "C"};
    exclusions.disliked = {"X|1", "Y|2"};
    exclusions.recentlyRejected = {"Z|3"};
    EXPECT_EQ(formatExclusionPrompt(exclusions, 2, 2), "EXCLUDE:A,B\nAVOID:X,Y");
}

// ============================================================================
// Statistics, Maintenance and Persistence
// ============================================================================

TEST_F(SuggestionHistoryTest, StatisticsCountEvents) {
    auto history = makeHistory();
    history->recordSuggestions({rec("A", "1"), rec("B", "2")});
    history->recordSuggestions({rec("A", "1")});
    advance(5s);
    ASSERT_TRUE(history->recordAccepted("A", "1"));
    ASSERT_TRUE(history->recordRejected("B", "2"));

    auto stats = history->statistics();
    EXPECT_EQ(stats.totalRecords, 5u);
    EXPECT_EQ(stats.totalSuggestions, 3u);
    EXPECT_EQ(stats.uniqueSuggested, 2u);
    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_TRUE(stats.toJson().contains("acceptanceRate"));
}

TEST_F(SuggestionHistoryTest, PruneKeepsDislikes) {
    auto history = makeHistory();
    history->recordSuggestions({rec("A", "1")});
    ASSERT_TRUE(history->recordDisliked("B", "2"));
    advance(std::chrono::hours(48));
    history->recordSuggestions({rec("C", "3")});

    EXPECT_EQ(history->prune(std::chrono::hours(24)), 1u);
    EXPECT_EQ(history->records().size(), 2u);
    EXPECT_TRUE(history->wasRejectedOrDisliked("B", "2"));
}

TEST_F(SuggestionHistoryTest, LedgerSurvivesReload) {
    auto file = dir_ / "history.json";
    {
        auto history = makeHistory(file);
        history->recordSuggestions({rec("A", "1")});
        ASSERT_TRUE(history->recordDisliked("B", "2"));
    }
    ASSERT_TRUE(std::filesystem::exists(file));

    auto reloaded = makeHistory(file);
    EXPECT_EQ(reloaded->records().size(), 2u);
    EXPECT_TRUE(reloaded->wasRejectedOrDisliked("B", "2"));
}

TEST_F(SuggestionHistoryTest, FailedWriteKeepsLedgerAndNextWriteIsComplete) {
    std::filesystem::create_directories(dir_);
    auto blocker = dir_ / "blocker";
    std::ofstream(blocker) << "not a directory";
    auto file = blocker / "history.json";

    auto history = makeHistory(file);
    history->recordSuggestions({rec("A", "1")});
    EXPECT_TRUE(history->recordDisliked("B", "2"));
    EXPECT_EQ(history->records().size(), 2u);
    EXPECT_EQ(history->statistics().disliked, 1u);
    EXPECT_FALSE(std::filesystem::exists(file));

    std::filesystem::remove(blocker);
    history->recordSuggestions({rec("C", "3")});
    ASSERT_TRUE(std::filesystem::exists(file));

    auto reloaded = makeHistory(file);
    EXPECT_EQ(reloaded->records().size(), 3u);
    EXPECT_TRUE(reloaded->wasRejectedOrDisliked("B", "2"));
    EXPECT_EQ(reloaded->suggestionCount("C", "3"), 1u);
}

TEST_F(SuggestionHistoryTest, CorruptDocumentStartsEmpty) {
    std::filesystem::create_directories(dir_);
    auto file = dir_ / "history.json";
    std::ofstream(file) << "{ not json";

    auto history = makeHistory(file);
    EXPECT_TRUE(history->records().empty());
    history->recordSuggestions({rec("A", "1")});
    EXPECT_EQ(history->records().size(), 1u);
}

TEST_F(SuggestionHistoryTest, UnknownRecordStatusIsSkipped) {
    std::filesystem::create_directories(dir_);
    auto file = dir_ / "history.json";
    std::ofstream(file)
        << R"({"version":1,"records":[)"
        << R"({"artist":"A","album":"1","status":"Exploded","timestamp":0},)"
        << R"({"artist":"B","album":"2","status":"Disliked","timestamp":0}]})";

    auto history = makeHistory(file);
    EXPECT_EQ(history->records().size(), 1u);
    EXPECT_TRUE(history->wasRejectedOrDisliked("B", "2"));
}
