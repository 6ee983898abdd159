#include <gtest/gtest.h>

#include "test_support.hpp"
#include "util.hpp"

using namespace soulwar;
using soulwar::testing::WorldFixture;
using soulwar::testing::quiet_config;

TEST(MovementTest, ValidPositionRules) {
  WorldFixture fx;
  const auto& movement = fx.world.movement();
  const TileMap& tiles = fx.world.state().tiles;

  EXPECT_TRUE(movement.is_valid_position(tiles, 700.0, 187.5, Faction::Light));
  // Within the barrier distance of the enemy tile centered at x = 762.5.
  EXPECT_FALSE(movement.is_valid_position(tiles, 740.0, 187.5, Faction::Light));
  EXPECT_FALSE(movement.is_valid_position(tiles, 800.0, 187.5, Faction::Light));
  EXPECT_TRUE(movement.is_valid_position(tiles, 800.0, 187.5, Faction::Dark));
  // Outside the world buffer.
  EXPECT_FALSE(movement.is_valid_position(tiles, 20.0, 450.0, Faction::Light));
  EXPECT_FALSE(movement.is_valid_position(tiles, 300.0, 880.0, Faction::Light));
}

TEST(MovementTest, CommittedSoulsHoldPosition) {
  WorldFixture fx;
  Soul& soul = fx.adult(Faction::Light, 700.0, 187.5);
  soul.transition_to(SoulState::Casting, 0.0);
  soul.vx = 3.0;
  fx.world.movement().move_soul(fx.world.state(), soul, 0.5);
  EXPECT_DOUBLE_EQ(soul.x, 700.0);
  EXPECT_DOUBLE_EQ(soul.y, 187.5);
  EXPECT_DOUBLE_EQ(soul.vx, 0.0);
}

TEST(MovementTest, HungrySoulHeadsForNearestOwnOrb) {
  WorldFixture fx;
  fx.world.spawn_orb(Faction::Light, 400.0, 450.0);
  fx.world.spawn_orb(Faction::Dark, 1000.0, 450.0);
  Soul& soul = fx.adult(Faction::Light, 300.0, 450.0, 30.0);
  soul.transition_to(SoulState::Hungry, 0.0);

  auto target = fx.world.movement().target_for(fx.world.state(), soul, 0.5);
  ASSERT_TRUE(target.has_value());
  EXPECT_DOUBLE_EQ(target->x, 400.0);

  fx.world.movement().move_soul(fx.world.state(), soul, 0.5);
  // Light moves at the daylight speed bonus.
  EXPECT_NEAR(soul.x, 300.0 + 5.0 * 1.2, 1e-9);
  EXPECT_NEAR(soul.y, 450.0, 1e-9);
}

TEST(MovementTest, SeekingSoulStopsWithinCastingReach) {
  WorldFixture fx;
  Soul& soul = fx.adult(Faction::Light, 700.0, 187.5);
  soul.transition_to(SoulState::Seeking, 0.0);
  fx.world.movement().move_soul(fx.world.state(), soul, 0.5);
  EXPECT_DOUBLE_EQ(soul.x, 700.0);
  EXPECT_DOUBLE_EQ(soul.vx, 0.0);
}

TEST(MovementTest, DefenderInRangeHoldsPosition) {
  WorldFixture fx;
  Soul& caster = fx.adult(Faction::Dark, 877.5, 712.5);
  caster.transition_to(SoulState::Casting, 0.0);
  Soul& defender = fx.adult(Faction::Light, 700.0, 712.5);
  defender.transition_to(SoulState::Defending, 0.0);
  defender.defend_target = caster.id;
  fx.world.movement().move_soul(fx.world.state(), defender, 0.5);
  EXPECT_DOUBLE_EQ(defender.x, 700.0);
}

TEST(MovementTest, DefenderApproachesButStaysHome) {
  WorldFixture fx;
  Soul& caster = fx.adult(Faction::Dark, 877.5, 712.5);
  caster.transition_to(SoulState::Casting, 0.0);
  Soul& defender = fx.adult(Faction::Light, 400.0, 712.5);
  defender.transition_to(SoulState::Defending, 0.0);
  defender.defend_target = caster.id;

  auto& movement = fx.world.movement();
  for (int i = 0; i < 100; ++i) {
    movement.move_soul(fx.world.state(), defender, 0.5);
    ASSERT_TRUE(movement.is_valid_position(fx.world.state().tiles, defender.x, defender.y, Faction::Light));
  }
  EXPECT_GT(defender.x, 600.0);
  EXPECT_LE(distance(defender.x, defender.y, caster.x, caster.y), fx.cfg.attack_range);
}

TEST(MovementTest, SoulsNeverLeaveTheirTerritory) {
  config::Config cfg = quiet_config();
  // No pairing, so every soul got where it is by moving.
  cfg.max_souls_per_team = 4;
  WorldFixture fx(cfg);
  fx.world.spawn_orb(Faction::Light, 400.0, 300.0);
  fx.adult(Faction::Light, 200.0, 700.0);
  fx.adult(Faction::Light, 300.0, 700.0);
  fx.adult(Faction::Light, 200.0, 600.0, 30.0);
  fx.adult(Faction::Light, 300.0, 600.0);
  for (int step = 1; step <= 600; ++step) {
    fx.tick_at(step / 30.0);
    for (const auto& [id, soul] : fx.world.state().souls) {
      if (soul.dead) {
        continue;
      }
      ASSERT_TRUE(fx.world.movement().is_valid_position(fx.world.state().tiles, soul.x, soul.y, soul.faction))
          << "soul " << id.value << " at (" << soul.x << ", " << soul.y << ")";
    }
  }
}

TEST(MovementTest, CollisionsPushOverlappingSoulsApart) {
  WorldFixture fx;
  Soul& a = fx.adult(Faction::Light, 300.0, 450.0);
  Soul& b = fx.adult(Faction::Light, 310.0, 450.0);
  fx.world.movement().resolve_collisions(fx.world.state());
  EXPECT_LT(a.x, 300.0);
  EXPECT_GT(b.x, 310.0);
  EXPECT_NEAR(b.x - a.x, 10.0 + (40.0 - 10.0) * 0.3, 1e-9);
}

TEST(MovementTest, CollisionsNeverMoveCasters) {
  WorldFixture fx;
  Soul& caster = fx.adult(Faction::Light, 300.0, 450.0);
  caster.transition_to(SoulState::Casting, 0.0);
  Soul& other = fx.adult(Faction::Light, 310.0, 450.0);
  fx.world.movement().resolve_collisions(fx.world.state());
  EXPECT_DOUBLE_EQ(caster.x, 300.0);
  EXPECT_NEAR(other.x, 310.0 + (40.0 - 10.0) * 0.3, 1e-9);
}

TEST(MovementTest, StuckDetectionNeedsFullHistory) {
  WorldFixture fx;
  Soul& soul = fx.adult(Faction::Light, 300.0, 450.0);
  EXPECT_FALSE(fx.world.movement().is_stuck(soul));
  for (int i = 0; i < fx.cfg.position_history_length; ++i) {
    soul.position_history.emplace_back(300.0 + 0.1 * i, 450.0);
  }
  EXPECT_TRUE(fx.world.movement().is_stuck(soul));
}

TEST(MovementTest, PathIntoEnemyTerritoryIsBlocked) {
  WorldFixture fx;
  Soul& soul = fx.adult(Faction::Light, 700.0, 450.0);
  const TileMap& tiles = fx.world.state().tiles;
  EXPECT_TRUE(fx.world.movement().path_blocked(tiles, soul, 900.0, 450.0));
  EXPECT_FALSE(fx.world.movement().path_blocked(tiles, soul, 500.0, 450.0));
  EXPECT_EQ(fx.world.movement().open_neighbors(tiles, soul), 3);
}
