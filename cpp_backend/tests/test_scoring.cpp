#include <gtest/gtest.h>

#include "config.hpp"
#include "scoring.hpp"
#include "tile_map.hpp"

using namespace soulwar;

class ScoringTest : public ::testing::Test {
 protected:
  ScoringTest() : map(TileMap::split(cfg)), scoring(cfg, map) {}

  config::Config cfg;
  TileMap map;
  ScoringSystem scoring;
};

TEST_F(ScoringTest, BorderRectangleSpansBothNexuses) {
  EXPECT_EQ(scoring.band_x(), 4);
  EXPECT_EQ(scoring.band_y(), 7);
  EXPECT_EQ(scoring.border().left, 6);
  EXPECT_EQ(scoring.border().right, 53);
  EXPECT_EQ(scoring.border().top, 5);
  EXPECT_EQ(scoring.border().bottom, 54);
}

TEST_F(ScoringTest, OwnTilesScoreZero) {
  EXPECT_EQ(scoring.score(10, 10, Faction::Light), 0);
  EXPECT_EQ(scoring.score(40, 10, Faction::Dark), 0);
}

TEST_F(ScoringTest, EnemyNexusFootprintScoresZero) {
  EXPECT_TRUE(scoring.in_nexus_footprint(50, 8, Faction::Dark));
  EXPECT_EQ(scoring.score(50, 8, Faction::Light), 0);
  EXPECT_EQ(scoring.score(8, 50, Faction::Dark), 0);
}

TEST_F(ScoringTest, TilesOutsideTheBandScoreZero) {
  EXPECT_FALSE(scoring.on_border_band(40, 30, Faction::Light));
  EXPECT_EQ(scoring.score(40, 30, Faction::Light), 0);
  EXPECT_EQ(scoring.score(30, 2, Faction::Light), 0);
}

TEST_F(ScoringTest, ScoreIsManhattanDistanceToEnemyNexus) {
  EXPECT_EQ(scoring.score(30, 12, Faction::Light), 18);
  EXPECT_EQ(scoring.score(30, 5, Faction::Light), 17);
  EXPECT_EQ(scoring.score(29, 47, Faction::Dark), 18);
  EXPECT_EQ(scoring.score(29, 48, Faction::Dark), 18);
}

TEST_F(ScoringTest, BestTileBreaksTiesInRowMajorOrder) {
  auto light = scoring.best_tile(Faction::Light);
  ASSERT_TRUE(light.has_value());
  EXPECT_EQ(*light, (TileCoord{30, 12}));

  auto dark = scoring.best_tile(Faction::Dark);
  ASSERT_TRUE(dark.has_value());
  EXPECT_EQ(*dark, (TileCoord{29, 47}));
}

TEST_F(ScoringTest, BestTileSkipsExcludedTiles) {
  auto next = scoring.best_tile(Faction::Light, [](TileCoord tile) { return tile == TileCoord{30, 12}; });
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*next, (TileCoord{30, 5}));
}

TEST_F(ScoringTest, RecomputeReflectsCapturedTiles) {
  map.capture({30, 12}, 1, Faction::Light);
  scoring.recompute();
  EXPECT_EQ(scoring.score(30, 12, Faction::Light), 0);
  EXPECT_EQ(scoring.score(32, 12, Faction::Light), 16);
  EXPECT_TRUE(scoring.has_capturable(Faction::Light));
}

TEST_F(ScoringTest, NothingCapturableWhenEverythingIsExcluded) {
  EXPECT_FALSE(scoring.has_capturable(Faction::Dark, [](TileCoord) { return true; }));
  EXPECT_FALSE(scoring.best_tile(Faction::Dark, [](TileCoord) { return true; }).has_value());
}
