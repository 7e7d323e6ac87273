/*
 * test_deduplicator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "exception/exception.hpp"
#include "fakes.hpp"
#include "history/suggestion_history.hpp"
#include "pipeline/deduplicator.hpp"
#include "review/review_queue.hpp"

#include <memory>
#include <unordered_set>

using namespace curator::pipeline;
using namespace curator::pipeline::test;
using curator::model::RecommendationMode;
using curator::review::ReviewStatus;

class DeduplicatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        library_ = std::make_shared<FakeLibrary>();
        history_ = std::make_shared<curator::history::SuggestionHistory>();
        queue_ = std::make_shared<curator::review::ReviewQueue>();
    }

    auto filter(const std::vector<Recommendation>& items,
                RecommendationMode mode = RecommendationMode::Albums)
        -> StageResult {
        Deduplicator dedup(library_, history_, queue_);
        return dedup.filter(items, mode, seen_);
    }

    std::shared_ptr<FakeLibrary> library_;
    std::shared_ptr<curator::history::SuggestionHistory> history_;
    std::shared_ptr<curator::review::ReviewQueue> queue_;
    std::unordered_set<std::string> seen_;
};

TEST_F(DeduplicatorTest, RequiresAllCollaborators) {
    EXPECT_THROW(Deduplicator(nullptr, history_, queue_),
                 curator::MissingDependencyException);
    EXPECT_THROW(Deduplicator(library_, nullptr, queue_),
                 curator::MissingDependencyException);
    EXPECT_THROW(Deduplicator(library_, history_, nullptr),
                 curator::MissingDependencyException);
}

TEST_F(DeduplicatorTest, DuplicatesWithinBatchAreDropped) {
    auto result = filter({rec("Yes", "Fragile"), rec("YES", " fragile")});
    ASSERT_EQ(result.kept.size(), 1u);
    ASSERT_EQ(result.filtered.size(), 1u);
    EXPECT_EQ(result.filtered[0].reason, "duplicate");
    EXPECT_TRUE(seen_.contains("yes|fragile"));
}

TEST_F(DeduplicatorTest, SeenKeysCarryAcrossBatches) {
    (void)filter({rec("Yes", "Fragile")});
    auto second = filter({rec("Yes", "Fragile")});
    EXPECT_TRUE(second.kept.empty());
}

TEST_F(DeduplicatorTest, LibraryItemsAreDropped) {
    library_->addAlbum("Genesis", "Foxtrot");
    auto albums = filter({rec("Genesis", "Foxtrot"), rec("Genesis", "Nursery Cryme")});
    ASSERT_EQ(albums.kept.size(), 1u);
    EXPECT_EQ(albums.filtered[0].reason, "already in library");

    seen_.clear();
    auto artists = filter({rec("Genesis", "")}, RecommendationMode::Artists);
    EXPECT_TRUE(artists.kept.empty());
}

TEST_F(DeduplicatorTest, HistoryAndReviewDecisionsAreHonored) {
    ASSERT_TRUE(history_->recordDisliked("Asia", "Astra"));
    queue_->enqueue({rec("Yes", "Drama"), rec("Yes", "Tormato")}, "");
    ASSERT_TRUE(queue_->setStatus("Yes", "Drama", ReviewStatus::Rejected));
    ASSERT_TRUE(queue_->setStatus("Yes", "Tormato", ReviewStatus::NeverAgain));

    auto result = filter({rec("Asia", "Astra"), rec("Yes", "Drama"),
                          rec("Yes", "Tormato"), rec("Camel", "Mirage")});
    ASSERT_EQ(result.kept.size(), 1u);
    EXPECT_EQ(result.kept[0].artist, "Camel");
    ASSERT_EQ(result.filtered.size(), 3u);
    EXPECT_EQ(result.filtered[0].reason, "previously rejected");
    EXPECT_EQ(result.filtered[1].reason, "rejected in review");
    EXPECT_EQ(result.filtered[2].reason, "marked never again");
}
