#include <gtest/gtest.h>

#include "buffs.hpp"
#include "disaster.hpp"
#include "soul.hpp"
#include "test_support.hpp"

using namespace soulwar;
using soulwar::testing::count_events;
using soulwar::testing::first_event;

class DisasterTest : public ::testing::Test {
 protected:
  DisasterTest() : world(TileMap::split(cfg)), rng(11) {
    cfg.disasters_enabled = true;
    for (int i = 0; i < 10; ++i) {
      Faction faction = i % 2 == 0 ? Faction::Light : Faction::Dark;
      double x = faction == Faction::Light ? 200.0 + 40.0 * i : 900.0 + 40.0 * i;
      SoulId id = world.next_soul_id();
      world.souls.emplace(id, make_soul(id, faction, x, 450.0, 0.0, false, cfg, rng));
    }
  }

  int dead_count() const {
    int count = 0;
    for (const auto& [id, soul] : world.souls) {
      count += soul.dead ? 1 : 0;
    }
    return count;
  }

  config::Config cfg;
  WorldState world;
  Rng rng;
};

TEST_F(DisasterTest, FreezingSnowSlowsBothFactionsAndKillsItsShare) {
  DisasterSystem disasters(cfg, rng, 0.0);
  EventList events;
  ASSERT_TRUE(disasters.trigger(world, DisasterKind::FreezingSnow, 0.0, events));
  ASSERT_TRUE(disasters.active().has_value());
  EXPECT_EQ(disasters.active()->kill_target, 3);
  EXPECT_EQ(count_events<event::DisasterStarted>(events), 1);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Light), 0.7);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Dark), 0.7);

  disasters.update(world, 10.0, events);
  EXPECT_EQ(dead_count(), 1);

  events.clear();
  disasters.update(world, 20.0, events);
  EXPECT_FALSE(disasters.active().has_value());
  EXPECT_EQ(dead_count(), 3);
  const auto* ended = first_event<event::DisasterEnded>(events);
  ASSERT_NE(ended, nullptr);
  EXPECT_EQ(ended->killed, 3);
  EXPECT_TRUE(world.buffs.empty());
}

TEST_F(DisasterTest, MeteoriteStormLandsEveryWaveBeforeEnding) {
  DisasterSystem disasters(cfg, rng, 0.0);
  EventList events;
  ASSERT_TRUE(disasters.trigger(world, DisasterKind::MeteoriteStorm, 0.0, events));
  const auto* started = first_event<event::DisasterStarted>(events);
  ASSERT_NE(started, nullptr);
  ASSERT_EQ(started->meteorites.size(), 3u);
  EXPECT_DOUBLE_EQ(started->meteorites[0].impact_offset, 15.0 / 4.0);
  EXPECT_TRUE(world.buffs.empty());

  events.clear();
  disasters.update(world, 15.0, events);
  EXPECT_FALSE(disasters.active().has_value());
  EXPECT_EQ(count_events<event::MeteoriteImpact>(events), 3);
  EXPECT_EQ(disasters.craters().size(), 3u);
  EXPECT_EQ(dead_count(), 2);
  EXPECT_EQ(first_event<event::DisasterEnded>(events)->killed, 2);
}

TEST_F(DisasterTest, OnlyOneDisasterAtATime) {
  DisasterSystem disasters(cfg, rng, 0.0);
  EventList events;
  ASSERT_TRUE(disasters.trigger(world, DisasterKind::FreezingSnow, 0.0, events));
  EXPECT_FALSE(disasters.trigger(world, DisasterKind::MeteoriteStorm, 1.0, events));
  EXPECT_EQ(disasters.active()->kind, DisasterKind::FreezingSnow);
}

TEST_F(DisasterTest, DisabledDisastersNeverStart) {
  cfg.disasters_enabled = false;
  cfg.freezing_snow.trigger_chance = 1.0;
  DisasterSystem disasters(cfg, rng, 0.0);
  EventList events;
  for (int i = 1; i <= 10; ++i) {
    disasters.update(world, 30.0 * i, events);
  }
  EXPECT_FALSE(disasters.active().has_value());
  EXPECT_TRUE(events.empty());
}

TEST_F(DisasterTest, CertainTriggerStartsAtFirstCheck) {
  cfg.freezing_snow.trigger_chance = 1.0;
  DisasterSystem disasters(cfg, rng, 0.0);
  EventList events;
  disasters.update(world, 29.0, events);
  EXPECT_FALSE(disasters.active().has_value());
  disasters.update(world, 30.0, events);
  ASSERT_TRUE(disasters.active().has_value());
  EXPECT_EQ(disasters.active()->kind, DisasterKind::FreezingSnow);
}

TEST_F(DisasterTest, CooldownBlocksRepeat) {
  cfg.freezing_snow.trigger_chance = 1.0;
  cfg.meteorite_storm.enabled = false;
  DisasterSystem disasters(cfg, rng, 0.0);
  EventList events;
  disasters.update(world, 30.0, events);
  disasters.update(world, 50.0, events);
  ASSERT_FALSE(disasters.active().has_value());

  events.clear();
  disasters.update(world, 90.0, events);
  EXPECT_FALSE(disasters.active().has_value());
  disasters.update(world, 210.0, events);
  EXPECT_TRUE(disasters.active().has_value());
}
