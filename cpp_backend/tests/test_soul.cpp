#include <gtest/gtest.h>

#include "config.hpp"
#include "soul.hpp"

using namespace soulwar;

namespace {

Soul adult_soul(const config::Config& cfg, Rng& rng) {
  return make_soul(SoulId{1}, Faction::Light, 300.0, 450.0, 0.0, false, cfg, rng);
}

}  // namespace

TEST(SoulTest, StartingEnergyWithinRange) {
  config::Config cfg;
  Rng rng(3);
  for (int i = 0; i < 50; ++i) {
    Soul soul = make_soul(SoulId{static_cast<std::uint32_t>(i + 1)}, Faction::Dark, 0.0, 0.0, 0.0, false, cfg, rng);
    EXPECT_GE(soul.energy, cfg.starting_energy_min);
    EXPECT_LE(soul.energy, cfg.starting_energy_max);
    EXPECT_EQ(soul.state, SoulState::Roaming);
  }
}

TEST(SoulTest, EnergyIsClampedAndZeroKills) {
  config::Config cfg;
  Rng rng(3);
  Soul soul = adult_soul(cfg, rng);
  soul.add_energy(500.0);
  EXPECT_DOUBLE_EQ(soul.energy, cfg.max_energy);
  EXPECT_FALSE(soul.dead);

  soul.remove_energy(500.0);
  EXPECT_DOUBLE_EQ(soul.energy, 0.0);
  EXPECT_TRUE(soul.dead);
}

TEST(SoulTest, ChildrenMatureOverTime) {
  config::Config cfg;
  Rng rng(3);
  Soul child = make_soul(SoulId{2}, Faction::Light, 0.0, 0.0, 10.0, true, cfg, rng);
  EXPECT_DOUBLE_EQ(child.energy, cfg.starting_energy_min);
  EXPECT_DOUBLE_EQ(child.maturity(25.0, cfg.child_maturity_time), 0.5);
  EXPECT_FALSE(child.is_adult(25.0, cfg.child_maturity_time));
  EXPECT_TRUE(child.is_adult(40.0, cfg.child_maturity_time));
}

TEST(SoulTest, TransitionClearsStateBookkeeping) {
  config::Config cfg;
  Rng rng(3);
  Soul soul = adult_soul(cfg, rng);
  soul.transition_to(SoulState::Preparing, 1.0);
  soul.pending_target = TileCoord{30, 12};

  soul.transition_to(SoulState::Casting, 2.0);
  EXPECT_TRUE(soul.pending_target.has_value());
  EXPECT_DOUBLE_EQ(soul.last_cast_at, 2.0);
  EXPECT_EQ(soul.previous_state, SoulState::Preparing);

  soul.transition_to(SoulState::Roaming, 5.0);
  EXPECT_FALSE(soul.pending_target.has_value());
  EXPECT_DOUBLE_EQ(soul.state_started_at, 5.0);
}

TEST(SoulTest, SelfTransitionKeepsStateTimer) {
  config::Config cfg;
  Rng rng(3);
  Soul soul = adult_soul(cfg, rng);
  soul.transition_to(SoulState::Hungry, 1.0);
  soul.transition_to(SoulState::Hungry, 4.0);
  EXPECT_DOUBLE_EQ(soul.time_in_state(4.0), 3.0);
}

TEST(SoulTest, RetreatEndsAfterDuration) {
  config::Config cfg;
  cfg.energy_drain_chance = 0.0;
  Rng rng(3);
  Soul soul = adult_soul(cfg, rng);
  soul.retreating = true;
  soul.last_attacked_at = 10.0;

  update_vitals(soul, 12.0, cfg, rng);
  EXPECT_TRUE(soul.retreating);
  update_vitals(soul, 15.0, cfg, rng);
  EXPECT_FALSE(soul.retreating);
}

TEST(SoulTest, DrainNeverAppliesWhileSleeping) {
  config::Config cfg;
  cfg.energy_drain_chance = 1.0;
  Rng rng(3);
  Soul soul = adult_soul(cfg, rng);
  double before = soul.energy;
  soul.sleeping = true;
  update_vitals(soul, 1.0, cfg, rng);
  EXPECT_DOUBLE_EQ(soul.energy, before);

  soul.sleeping = false;
  update_vitals(soul, 2.0, cfg, rng);
  EXPECT_DOUBLE_EQ(soul.energy, before - cfg.energy_drain_amount);
}

TEST(SoulTest, PositionHistoryIsBounded) {
  config::Config cfg;
  Rng rng(3);
  Soul soul = adult_soul(cfg, rng);
  for (int i = 0; i < cfg.position_history_length + 10; ++i) {
    soul.x = static_cast<double>(i);
    record_position(soul, cfg);
  }
  EXPECT_EQ(static_cast<int>(soul.position_history.size()), cfg.position_history_length);
  EXPECT_DOUBLE_EQ(soul.position_history.back().first, static_cast<double>(cfg.position_history_length + 9));
}
