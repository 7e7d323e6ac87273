/*
 * test_recommendation_pipeline.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: End-to-end tests for RecommendationPipeline with mocked
             provider

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "cache/bounded_cache.hpp"
#include "exception/exception.hpp"
#include "fakes.hpp"
#include "pipeline/prompt_planner.hpp"
#include "pipeline/recommendation_pipeline.hpp"
#include "pipeline/safety_gate.hpp"

#include <chrono>
#include <memory>
#include <stop_token>

using namespace curator::pipeline;
using namespace curator::pipeline::test;
using curator::cache::BoundedCache;
using curator::cache::BoundedCacheOptions;
using curator::cache::StaticConfigVersionProvider;
using curator::review::ReviewStatus;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class RecommendationPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<NiceMock<MockProvider>>();
        ON_CALL(*provider_, name()).WillByDefault(Return("mock:model"));
        library_ = std::make_shared<FakeLibrary>();
        history_ = std::make_shared<curator::history::SuggestionHistory>();
        queue_ = std::make_shared<curator::review::ReviewQueue>();

        BoundedCacheOptions options;
        options.maxSize = 16;
        options.sweepInterval = 0ms;
        cache_ = std::make_shared<BoundedCache<std::string, PipelineResult>>(
            options);

        settings_.maxRecommendations = 3;
        settings_.styleFilters = {"progressive-rock"};
        settings_.backfill = BackfillStrategy::Off;
    }

    auto dependencies(double minConfidence = 0.5) -> PipelineDependencies {
        PipelineDependencies deps;
        deps.provider = provider_;
        deps.library = library_;
        deps.history = history_;
        deps.reviewQueue = queue_;
        deps.safetyGate = std::make_shared<MinimumConfidenceGate>(minConfidence);
        deps.planner = std::make_shared<DefaultPromptPlanner>();
        deps.cache = cache_;
        deps.versionProvider =
            std::make_shared<StaticConfigVersionProvider>("1");
        return deps;
    }

    std::shared_ptr<NiceMock<MockProvider>> provider_;
    std::shared_ptr<FakeLibrary> library_;
    std::shared_ptr<curator::history::SuggestionHistory> history_;
    std::shared_ptr<curator::review::ReviewQueue> queue_;
    std::shared_ptr<BoundedCache<std::string, PipelineResult>> cache_;
    RunSettings settings_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(RecommendationPipelineTest, MissingCollaboratorIsRejected) {
    auto deps = dependencies();
    deps.cache = nullptr;
    EXPECT_THROW(RecommendationPipeline{deps},
                 curator::MissingDependencyException);

    deps = dependencies();
    deps.provider = nullptr;
    EXPECT_THROW(RecommendationPipeline{deps},
                 curator::MissingDependencyException);
}

// ============================================================================
// Stage Routing
// ============================================================================

TEST_F(RecommendationPipelineTest, RejectsAreRoutedByStage) {
    library_->addAlbum("Genesis", "Foxtrot");
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Return(std::vector<Recommendation>{
            rec("Yes", "Close to the Edge"),
            rec("Miles Davis", "Kind of Blue", "Jazz"),
            rec("Camel", "Mirage", "Progressive Rock", 0.2),
            rec("Genesis", "Foxtrot"),
            rec("<script>x</script>", "Bad")}));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);

    ASSERT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(result.accepted[0].artist, "Yes");
    EXPECT_FALSE(result.fromCache);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.filtered.size(), 4u);

    // Dedup, style and safety rejects wait for a human decision.
    EXPECT_EQ(queue_->statusOf("Miles Davis", "Kind of Blue"),
              ReviewStatus::Pending);
    EXPECT_EQ(queue_->statusOf("Camel", "Mirage"), ReviewStatus::Pending);
    EXPECT_EQ(queue_->statusOf("Genesis", "Foxtrot"), ReviewStatus::Pending);
    EXPECT_FALSE(queue_->statusOf("<script>x</script>", "Bad").has_value());
    EXPECT_EQ(queue_->getCounts().pending, 3u);

    bool libraryNoteSeen = false;
    for (const auto& item : queue_->getPending()) {
        if (item.artist == "Genesis") {
            libraryNoteSeen = item.notes == "already in library";
        }
    }
    EXPECT_TRUE(libraryNoteSeen);

    EXPECT_EQ(history_->suggestionCount("Yes", "Close to the Edge"), 1u);
    EXPECT_EQ(history_->suggestionCount("Miles Davis", "Kind of Blue"), 0u);
}

TEST_F(RecommendationPipelineTest, ReportCountsSanitizerDrops) {
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Return(std::vector<Recommendation>{
            rec("Yes", "Fragile", "Progressive Rock", 1.4),
            rec("<script>x</script>", "Bad")}));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);

    EXPECT_EQ(result.report.totalItems, 2u);
    EXPECT_EQ(result.report.droppedItems, 1u);
    EXPECT_EQ(result.report.clampedConfidences, 1u);
    ASSERT_EQ(result.accepted.size(), 1u);
    EXPECT_DOUBLE_EQ(result.accepted[0].confidence, 1.0);
}

// ============================================================================
// Review Release
// ============================================================================

TEST_F(RecommendationPipelineTest, AcceptedReviewItemsLeadTheBatch) {
    queue_->enqueue({rec("Camel", "Moonmadness", "Jazz")}, "style mismatch");
    ASSERT_TRUE(queue_->setStatus("Camel", "Moonmadness", ReviewStatus::Accepted));
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Return(std::vector<Recommendation>{rec("Yes", "Fragile")}));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);

    ASSERT_EQ(result.accepted.size(), 2u);
    EXPECT_EQ(result.accepted[0].artist, "Camel");
    EXPECT_EQ(result.released, 1u);
    EXPECT_FALSE(queue_->statusOf("Camel", "Moonmadness").has_value());
    // Released items are not counted as new suggestions.
    EXPECT_EQ(history_->suggestionCount("Camel", "Moonmadness"), 0u);
    EXPECT_EQ(history_->statistics().accepted, 1u);
}

TEST_F(RecommendationPipelineTest, InBatchRepeatIsNotQueuedForReview) {
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Return(std::vector<Recommendation>{
            rec("Yes", "Fragile"), rec("yes", "FRAGILE")}));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);

    ASSERT_EQ(result.accepted.size(), 1u);
    ASSERT_EQ(result.filtered.size(), 1u);
    EXPECT_EQ(result.filtered[0].reason, "duplicate");
    EXPECT_EQ(queue_->getCounts().total(), 0u);
}

TEST_F(RecommendationPipelineTest, ReleaseIsBoundedByBatchSize) {
    settings_.maxRecommendations = 1;
    queue_->enqueue({rec("A", "1"), rec("B", "2"), rec("C", "3")}, "");
    ASSERT_TRUE(queue_->setStatus("A", "1", ReviewStatus::Accepted));
    ASSERT_TRUE(queue_->setStatus("B", "2", ReviewStatus::Accepted));
    ASSERT_TRUE(queue_->setStatus("C", "3", ReviewStatus::Accepted));

    RecommendationPipeline pipeline(dependencies());
    auto first = pipeline.process({}, settings_);

    ASSERT_EQ(first.accepted.size(), 1u);
    EXPECT_EQ(first.released, 1u);
    EXPECT_EQ(queue_->getCounts().accepted, 2u);
    EXPECT_EQ(history_->statistics().accepted, 1u);

    auto second = pipeline.process({}, settings_);
    ASSERT_EQ(second.accepted.size(), 1u);
    EXPECT_NE(second.accepted[0].artist, first.accepted[0].artist);
    EXPECT_EQ(queue_->getCounts().accepted, 1u);
}

TEST_F(RecommendationPipelineTest, ReleasesDisplaceFreshItemsPastTheLimit) {
    settings_.maxRecommendations = 2;
    queue_->enqueue({rec("Camel", "Moonmadness")}, "style mismatch");
    ASSERT_TRUE(queue_->setStatus("Camel", "Moonmadness", ReviewStatus::Accepted));

    RecommendationPipeline pipeline(dependencies());
    auto result =
        pipeline.process({rec("Yes", "Fragile"), rec("Genesis", "Foxtrot")},
                         settings_);

    ASSERT_EQ(result.accepted.size(), 2u);
    EXPECT_EQ(result.accepted[0].artist, "Camel");
    EXPECT_EQ(result.accepted[1].artist, "Yes");
    ASSERT_EQ(result.filtered.size(), 1u);
    EXPECT_EQ(result.filtered[0].stage, PipelineStage::Truncate);
    EXPECT_EQ(history_->suggestionCount("Genesis", "Foxtrot"), 0u);
}

TEST_F(RecommendationPipelineTest, ReleasedItemSupersedesFreshDuplicate) {
    queue_->enqueue({rec("Yes", "Fragile")}, "low confidence");
    ASSERT_TRUE(queue_->setStatus("Yes", "Fragile", ReviewStatus::Accepted));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.process({rec("Yes", "Fragile")}, settings_);

    ASSERT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(result.released, 1u);
    ASSERT_EQ(result.filtered.size(), 1u);
    EXPECT_EQ(result.filtered[0].stage, PipelineStage::Deduplicate);
    EXPECT_EQ(history_->suggestionCount("Yes", "Fragile"), 0u);
}

TEST_F(RecommendationPipelineTest, InvalidReviewItemIsNotReleased) {
    queue_->enqueue({rec("<script>x</script>", "Bad")}, "edited by hand");
    ASSERT_TRUE(
        queue_->setStatus("<script>x</script>", "Bad", ReviewStatus::Accepted));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.process({}, settings_);

    EXPECT_TRUE(result.accepted.empty());
    EXPECT_EQ(result.released, 0u);
    ASSERT_EQ(result.filtered.size(), 1u);
    EXPECT_EQ(result.filtered[0].stage, PipelineStage::Sanitize);
    EXPECT_EQ(result.filtered[0].reason, "invalid review item");
    EXPECT_EQ(history_->statistics().accepted, 0u);
}

TEST_F(RecommendationPipelineTest, CancelledRunLeavesAcceptedItemsQueued) {
    queue_->enqueue({rec("Camel", "Moonmadness")}, "style mismatch");
    ASSERT_TRUE(queue_->setStatus("Camel", "Moonmadness", ReviewStatus::Accepted));
    std::stop_source source;
    source.request_stop();

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.process({rec("Yes", "Fragile")}, settings_,
                                   source.get_token());

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.released, 0u);
    EXPECT_EQ(queue_->statusOf("Camel", "Moonmadness"), ReviewStatus::Accepted);
}

// ============================================================================
// Top-up and Truncation
// ============================================================================

TEST_F(RecommendationPipelineTest, TopUpFillsShortBatch) {
    settings_.backfill = BackfillStrategy::Standard;
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Return(std::vector<Recommendation>{rec("Yes", "Fragile")}))
        .WillOnce(Invoke([](const std::string& prompt, std::stop_token) {
            EXPECT_THAT(prompt, HasSubstr("Recommend 2 albums"));
            EXPECT_THAT(prompt, HasSubstr("Yes|Fragile"));
            return std::vector<Recommendation>{rec("Yes", "Fragile"),
                                               rec("Camel", "Mirage"),
                                               rec("Genesis", "Foxtrot")};
        }));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);

    EXPECT_EQ(result.accepted.size(), 3u);
    EXPECT_EQ(result.topUpAttempts, 1u);
}

TEST_F(RecommendationPipelineTest, TopUpStopsWithoutGain) {
    settings_.backfill = BackfillStrategy::Standard;
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .Times(2)
        .WillRepeatedly(
            Return(std::vector<Recommendation>{rec("Yes", "Fragile")}));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);

    EXPECT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(result.topUpAttempts, 1u);
}

TEST_F(RecommendationPipelineTest, TopUpSkippedWhenNothingSurvives) {
    settings_.backfill = BackfillStrategy::Aggressive;
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .Times(1)
        .WillOnce(Return(std::vector<Recommendation>{
            rec("Miles Davis", "Kind of Blue", "Jazz")}));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);
    EXPECT_TRUE(result.accepted.empty());
    EXPECT_EQ(result.topUpAttempts, 0u);
}

TEST_F(RecommendationPipelineTest, TopUpProviderFailureKeepsBatch) {
    settings_.backfill = BackfillStrategy::Standard;
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Return(std::vector<Recommendation>{rec("Yes", "Fragile")}))
        .WillOnce(Invoke([](const std::string&, std::stop_token)
                             -> std::vector<Recommendation> {
            THROW_PROVIDER_EXCEPTION("rate limited");
        }));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);
    EXPECT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(result.topUpAttempts, 1u);
}

TEST_F(RecommendationPipelineTest, OverflowIsTruncated) {
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Return(std::vector<Recommendation>{
            rec("A", "1"), rec("B", "2"), rec("C", "3"), rec("D", "4"),
            rec("E", "5")}));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_);

    ASSERT_EQ(result.accepted.size(), 3u);
    ASSERT_EQ(result.filtered.size(), 2u);
    EXPECT_EQ(result.filtered[0].stage, PipelineStage::Truncate);
    EXPECT_EQ(result.filtered[0].reason, "over limit");
    EXPECT_EQ(history_->suggestionCount("D", "4"), 0u);
    EXPECT_EQ(history_->suggestionCount("C", "3"), 1u);
}

// ============================================================================
// Caching and Failure
// ============================================================================

TEST_F(RecommendationPipelineTest, IdenticalRunIsServedFromCache) {
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .Times(1)
        .WillOnce(Return(std::vector<Recommendation>{rec("Yes", "Fragile")}));

    RecommendationPipeline pipeline(dependencies());
    auto first = pipeline.run(settings_);
    auto second = pipeline.run(settings_);

    EXPECT_FALSE(first.fromCache);
    EXPECT_TRUE(second.fromCache);
    ASSERT_EQ(second.accepted.size(), 1u);
    EXPECT_EQ(second.accepted[0].artist, "Yes");
}

TEST_F(RecommendationPipelineTest, CacheHitDoesNotRedeliverReleases) {
    queue_->enqueue({rec("Camel", "Moonmadness")}, "style mismatch");
    ASSERT_TRUE(queue_->setStatus("Camel", "Moonmadness", ReviewStatus::Accepted));
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .Times(1)
        .WillOnce(Return(std::vector<Recommendation>{rec("Yes", "Fragile")}));

    RecommendationPipeline pipeline(dependencies());
    auto first = pipeline.run(settings_);
    auto second = pipeline.run(settings_);

    ASSERT_EQ(first.accepted.size(), 2u);
    EXPECT_EQ(first.released, 1u);
    EXPECT_TRUE(second.fromCache);
    ASSERT_EQ(second.accepted.size(), 1u);
    EXPECT_EQ(second.accepted[0].artist, "Yes");
    EXPECT_EQ(second.released, 0u);
    EXPECT_EQ(history_->statistics().accepted, 1u);
    EXPECT_EQ(history_->suggestionCount("Yes", "Fragile"), 1u);
}

TEST_F(RecommendationPipelineTest, LibraryChangeInvalidatesCacheKey) {
    RecommendationPipeline pipeline(dependencies());
    auto before = pipeline.cacheKey(settings_);
    library_->addAlbum("Yes", "Fragile");
    EXPECT_NE(before, pipeline.cacheKey(settings_));
}

TEST_F(RecommendationPipelineTest, ProviderFailurePropagatesUncached) {
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Invoke([](const std::string&, std::stop_token)
                             -> std::vector<Recommendation> {
            THROW_PROVIDER_EXCEPTION("provider unavailable");
        }))
        .WillOnce(Return(std::vector<Recommendation>{rec("Yes", "Fragile")}));

    RecommendationPipeline pipeline(dependencies());
    EXPECT_THROW(pipeline.run(settings_), curator::ProviderException);
    EXPECT_EQ(cache_->size(), 0u);

    auto retry = pipeline.run(settings_);
    EXPECT_EQ(retry.accepted.size(), 1u);
}

TEST_F(RecommendationPipelineTest, CancelledRunReturnsPartialAndIsNotCached) {
    std::stop_source source;
    settings_.backfill = BackfillStrategy::Aggressive;
    EXPECT_CALL(*provider_, getRecommendations(_, _))
        .WillOnce(Invoke([&source](const std::string&, std::stop_token) {
            source.request_stop();
            return std::vector<Recommendation>{rec("Yes", "Fragile")};
        }));

    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.run(settings_, source.get_token());

    EXPECT_TRUE(result.cancelled);
    ASSERT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(result.topUpAttempts, 0u);
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(RecommendationPipelineTest, ProcessBypassesCache) {
    RecommendationPipeline pipeline(dependencies());
    auto result = pipeline.process({rec("Yes", "Fragile")}, settings_);
    EXPECT_EQ(result.accepted.size(), 1u);
    EXPECT_EQ(cache_->size(), 0u);
    EXPECT_TRUE(result.toJson().contains("accepted"));
}
