/*
 * test_style_guard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "pipeline/style_guard.hpp"

using namespace curator::pipeline;
using curator::model::Recommendation;

namespace {

auto rec(std::string artist, std::string album, std::string genre)
    -> Recommendation {
    Recommendation r;
    r.artist = std::move(artist);
    r.album = std::move(album);
    r.genre = std::move(genre);
    r.confidence = 0.9;
    return r;
}

}  // namespace

TEST(StyleGuardTest, StrictModeKeepsOnlyMatchingStyles) {
    StyleGuard guard;
    auto result = guard.apply(
        {rec("Yes", "Close to the Edge", "Progressive Rock"),
         rec("Miles Davis", "Kind of Blue", "Jazz")},
        {"progressive-rock"}, false);

    ASSERT_EQ(result.kept.size(), 1u);
    EXPECT_EQ(result.kept[0].artist, "Yes");
    ASSERT_EQ(result.filtered.size(), 1u);
    EXPECT_EQ(result.filtered[0].item.artist, "Miles Davis");
    EXPECT_EQ(result.filtered[0].stage, PipelineStage::StyleGuard);
    EXPECT_EQ(result.filtered[0].reason, "style mismatch: Jazz");
}

TEST(StyleGuardTest, MultiTagGenresMatchAnyTag) {
    StyleGuard guard;
    auto result = guard.apply({rec("Camel", "Mirage", "Symphonic; Progressive Rock")},
                              {"Progressive Rock"}, false);
    EXPECT_EQ(result.kept.size(), 1u);
}

TEST(StyleGuardTest, RelaxedModeOrdersMatchesFirst) {
    StyleGuard guard;
    auto result = guard.apply(
        {rec("Miles Davis", "Kind of Blue", "Jazz"),
         rec("Yes", "Close to the Edge", "Progressive Rock"),
         rec("Coltrane", "Blue Train", "")},
        {"progressive-rock"}, true);

    EXPECT_TRUE(result.filtered.empty());
    ASSERT_EQ(result.kept.size(), 3u);
    EXPECT_EQ(result.kept[0].artist, "Yes");
    EXPECT_EQ(result.kept[1].artist, "Miles Davis");
    EXPECT_EQ(result.kept[2].artist, "Coltrane");
}

TEST(StyleGuardTest, NoFiltersPassesEverything) {
    StyleGuard guard;
    auto result = guard.apply({rec("A", "1", "Jazz")}, {}, false);
    EXPECT_EQ(result.kept.size(), 1u);
    EXPECT_TRUE(result.filtered.empty());
}

TEST(StyleGuardTest, MissingGenreIsReported) {
    StyleGuard guard;
    auto result = guard.apply({rec("A", "1", "")}, {"jazz"}, false);
    ASSERT_EQ(result.filtered.size(), 1u);
    EXPECT_EQ(result.filtered[0].reason, "style mismatch: no genre");
}
