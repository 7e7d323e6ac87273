/*
 * test_curator_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Tests for configuration sections and the CuratorConfig loader

**************************************************/

#include <gtest/gtest.h>

#include "config/curator_config.hpp"

#include <filesystem>
#include <fstream>

using namespace curator::config;
using curator::model::RecommendationMode;
using curator::pipeline::BackfillStrategy;

class CuratorConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "curator_config_test";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    auto writeFile(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

// ============================================================================
// Sections
// ============================================================================

TEST_F(CuratorConfigTest, SectionPathsAndKeys) {
    EXPECT_EQ(CacheConfig::path(), "/curator/cache");
    EXPECT_EQ(CacheConfig::key(), "cache");
    EXPECT_EQ(PipelineSettings::key(), "pipeline");
    EXPECT_EQ(LoggingConfig::key(), "logging");
}

TEST_F(CuratorConfigTest, DeserializeKeepsDefaultsForMissingKeys) {
    auto cache = CacheConfig::fromJson({{"maxSize", 42}});
    EXPECT_EQ(cache.maxSize, 42u);
    EXPECT_EQ(cache.sweepBatchSize, 256u);

    EXPECT_FALSE(CacheConfig::tryFromJson({{"maxSize", "lots"}}).has_value());
}

TEST_F(CuratorConfigTest, SchemaDrivesViolations) {
    EXPECT_TRUE(PipelineSettings::defaults().violations().empty());

    PipelineSettings pipeline;
    pipeline.maxRecommendations = 500;
    pipeline.backfill = "eager";
    auto problems = pipeline.violations();
    ASSERT_EQ(problems.size(), 2u);
    for (const auto& problem : problems) {
        EXPECT_EQ(problem.rfind("/curator/pipeline/", 0), 0u) << problem;
    }

    StorageConfig storage;
    storage.dataDir.clear();
    ASSERT_EQ(storage.violations().size(), 1u);
    EXPECT_NE(storage.violations()[0].find("dataDir"), std::string::npos);
}

TEST_F(CuratorConfigTest, SchemaCarriesRanges) {
    auto schema = CacheConfig::schema();
    EXPECT_EQ(schema["properties"]["maxSize"]["minimum"], 1);
    EXPECT_EQ(schema["properties"]["maxSize"]["default"], 1000);
}

TEST_F(CuratorConfigTest, PipelineSettingsConvertToRunSettings) {
    auto section = PipelineSettings::fromJson({{"maxRecommendations", 5},
                                               {"mode", "artists"},
                                               {"backfill", "aggressive"},
                                               {"styleFilters", {"Jazz"}}});
    auto settings = section.toRunSettings();
    EXPECT_EQ(settings.maxRecommendations, 5);
    EXPECT_EQ(settings.mode, RecommendationMode::Artists);
    EXPECT_EQ(settings.backfill, BackfillStrategy::Aggressive);
    ASSERT_EQ(settings.styleFilters.size(), 1u);
}

TEST_F(CuratorConfigTest, CacheConfigConvertsToOptions) {
    CacheConfig cache;
    cache.defaultTtlSeconds = 0;
    cache.sweepIntervalSeconds = 5;
    auto options = cache.toOptions();
    EXPECT_FALSE(options.defaultTtl.has_value());
    EXPECT_EQ(options.sweepInterval, std::chrono::seconds(5));
    EXPECT_EQ(options.maxSize, 1000u);
}

TEST_F(CuratorConfigTest, StorageResolvesUnderDataDir) {
    StorageConfig storage;
    storage.dataDir = "/var/lib/curator";
    EXPECT_EQ(storage.resolve(storage.historyFile),
              std::filesystem::path("/var/lib/curator/recommendation_history.json"));
}

TEST_F(CuratorConfigTest, HistoryConfigConvertsToOptions) {
    HistoryConfig history;
    history.rejectionMemoryDays = 2;
    auto options = history.toOptions("h.json");
    EXPECT_EQ(options.rejectionMemory, std::chrono::hours(48));
    EXPECT_EQ(options.filePath, std::filesystem::path("h.json"));
}

// ============================================================================
// Document Loading
// ============================================================================

TEST_F(CuratorConfigTest, EmptyDocumentYieldsDefaults) {
    auto config = CuratorConfig::fromJson(json::object());
    EXPECT_EQ(config.pipeline.maxRecommendations, 10);
    EXPECT_EQ(config.storage.dataDir, "data");
    EXPECT_FALSE(config.logging.enableFile);
}

TEST_F(CuratorConfigTest, NestedAndFlatDocumentsAreAccepted) {
    auto nested = CuratorConfig::fromJson(
        {{"curator", {{"pipeline", {{"maxRecommendations", 7}}}}}});
    EXPECT_EQ(nested.pipeline.maxRecommendations, 7);

    auto flat = CuratorConfig::fromJson({{"cache", {{"maxSize", 12}}}});
    EXPECT_EQ(flat.cache.maxSize, 12u);
}

TEST_F(CuratorConfigTest, OutOfRangeValuesAreRejected) {
    EXPECT_THROW(CuratorConfig::fromJson(
                     {{"pipeline", {{"maxRecommendations", 0}}}}),
                 InvalidConfigException);
    EXPECT_THROW(CuratorConfig::fromJson({{"pipeline", {{"mode", "songs"}}}}),
                 InvalidConfigException);
    EXPECT_THROW(
        CuratorConfig::fromJson({{"pipeline", {{"minConfidence", 1.5}}}}),
        InvalidConfigException);
    EXPECT_THROW(
        CuratorConfig::fromJson({{"logging", {{"consoleLevel", "loud"}}}}),
        InvalidConfigException);
}

TEST_F(CuratorConfigTest, WrongTypesAreRejected) {
    EXPECT_THROW(CuratorConfig::fromJson({{"cache", 5}}),
                 InvalidConfigException);
    EXPECT_THROW(CuratorConfig::fromJson({{"cache", {{"maxSize", "big"}}}}),
                 InvalidConfigException);
    EXPECT_THROW(CuratorConfig::fromJson(json::array()),
                 InvalidConfigException);
}

TEST_F(CuratorConfigTest, LoadFromFile) {
    auto path = writeFile(
        "curator.json",
        R"({"curator": {"history": {"rejectionMemoryDays": 3},
                        "storage": {"dataDir": "state"}}})");
    auto config = CuratorConfig::loadFromFile(path);
    EXPECT_EQ(config.history.rejectionMemoryDays, 3);
    EXPECT_EQ(config.storage.dataDir, "state");

    auto reloaded = CuratorConfig::fromJson(config.toJson());
    EXPECT_EQ(reloaded.storage.dataDir, "state");
}

TEST_F(CuratorConfigTest, MissingFileRaisesIoError) {
    EXPECT_THROW(CuratorConfig::loadFromFile(dir_ / "absent.json"),
                 ConfigIOException);
}

TEST_F(CuratorConfigTest, MalformedFileIsInvalid) {
    auto path = writeFile("broken.json", "{ not json");
    EXPECT_THROW(CuratorConfig::loadFromFile(path), InvalidConfigException);
    // Both derive from the common configuration error.
    EXPECT_THROW(CuratorConfig::loadFromFile(path), BadConfigException);
}
