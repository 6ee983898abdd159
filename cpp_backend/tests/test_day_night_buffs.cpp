#include <gtest/gtest.h>

#include "buffs.hpp"
#include "day_night.hpp"
#include "test_support.hpp"

using namespace soulwar;
using soulwar::testing::count_events;
using soulwar::testing::first_event;

TEST(DayNightTest, PhaseBoundaries) {
  config::Config cfg;
  DayNightSystem cycle(cfg, 0.0);
  EXPECT_EQ(cycle.phase(0.0), DayPhase::Day);
  EXPECT_EQ(cycle.phase(47.9), DayPhase::Day);
  EXPECT_EQ(cycle.phase(48.5), DayPhase::Dusk);
  EXPECT_EQ(cycle.phase(60.5), DayPhase::Night);
  EXPECT_EQ(cycle.phase(108.5), DayPhase::Dawn);

  PhaseInfo next = cycle.info(120.0);
  EXPECT_EQ(next.phase, DayPhase::Day);
  EXPECT_EQ(next.cycle, 1);
  EXPECT_DOUBLE_EQ(next.cycle_progress, 0.0);
}

TEST(DayNightTest, AmbientLightFadesThroughDusk) {
  config::Config cfg;
  DayNightSystem cycle(cfg, 0.0);
  EXPECT_DOUBLE_EQ(cycle.info(10.0).ambient_light, 1.0);
  EXPECT_DOUBLE_EQ(cycle.info(70.0).ambient_light, 0.3);
  double mid = cycle.info(54.0).ambient_light;
  EXPECT_GT(mid, 0.3);
  EXPECT_LT(mid, 1.0);
}

TEST(DayNightTest, FavoredFactionFollowsPhase) {
  config::Config cfg;
  DayNightSystem cycle(cfg, 0.0);
  EXPECT_TRUE(cycle.is_favored(Faction::Light, 10.0));
  EXPECT_TRUE(cycle.is_unfavored(Faction::Dark, 10.0));
  EXPECT_FALSE(cycle.is_favored(Faction::Light, 50.0));
  EXPECT_FALSE(cycle.is_favored(Faction::Dark, 50.0));
  EXPECT_TRUE(cycle.is_favored(Faction::Dark, 70.0));
}

TEST(DayNightTest, PhaseChangeSwapsBlessing) {
  config::Config cfg;
  WorldState world(TileMap::split(cfg));
  DayNightSystem cycle(cfg, 0.0);
  EventList events;

  cycle.update(world, 0.0, events);
  const auto* first = first_event<event::DayNightPhaseChange>(events);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->phase, DayPhase::Day);
  EXPECT_EQ(first->previous, DayPhase::Day);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Light), cfg.phase_speed_multiplier);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Dark), 1.0);

  events.clear();
  cycle.update(world, 10.0, events);
  EXPECT_TRUE(events.empty());

  cycle.update(world, 61.0, events);
  const auto* night = first_event<event::DayNightPhaseChange>(events);
  ASSERT_NE(night, nullptr);
  EXPECT_EQ(night->phase, DayPhase::Night);
  EXPECT_EQ(night->previous, DayPhase::Day);
  EXPECT_EQ(count_events<event::BuffRemoved>(events), 1);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Light), 1.0);
  EXPECT_DOUBLE_EQ(buffs::cast_time_multiplier(world, Faction::Dark), cfg.phase_cast_time_multiplier);
  ASSERT_EQ(world.buffs.size(), 1u);
  EXPECT_EQ(world.buffs.begin()->second.name, "night_blessing");

  events.clear();
  cycle.update(world, 110.0, events);
  EXPECT_TRUE(world.buffs.empty());
  EXPECT_EQ(count_events<event::BuffApplied>(events), 0);
}

TEST(BuffTest, SameNamedBuffReplacesInsteadOfStacking) {
  WorldState world(TileMap(4, 4, 10.0, 10.0));
  EventList events;
  buffs::apply(world, BuffSource::Spell, Faction::Light, "conquest", BuffEffects{1.1, 1.0, 1.0, 1.0}, 0.0, 10.0,
               events);
  buffs::apply(world, BuffSource::Spell, Faction::Light, "conquest", BuffEffects{1.1, 1.0, 1.0, 1.0}, 5.0, 10.0,
               events);
  ASSERT_EQ(world.buffs.size(), 1u);
  EXPECT_DOUBLE_EQ(*world.buffs.begin()->second.expires_at, 15.0);
  EXPECT_EQ(count_events<event::BuffRemoved>(events), 1);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Light), 1.1);
}

TEST(BuffTest, MultipliersCompose) {
  WorldState world(TileMap(4, 4, 10.0, 10.0));
  EventList events;
  buffs::apply(world, BuffSource::DayNight, Faction::Dark, "night_blessing", BuffEffects{1.2, 0.8, 1.5, 1.0}, 0.0,
               std::nullopt, events);
  buffs::apply(world, BuffSource::Disaster, Faction::Dark, "freezing_snow", BuffEffects{0.7, 1.0, 1.0, 1.0}, 0.0,
               std::nullopt, events);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Dark), 1.2 * 0.7);
  EXPECT_DOUBLE_EQ(buffs::energy_multiplier(world, Faction::Dark), 1.5);
  EXPECT_DOUBLE_EQ(buffs::damage_multiplier(world, Faction::Dark), 1.0);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Light), 1.0);

  buffs::clear_source(world, BuffSource::Disaster, events);
  EXPECT_DOUBLE_EQ(buffs::speed_multiplier(world, Faction::Dark), 1.2);
}

TEST(BuffTest, TimedBuffsExpire) {
  WorldState world(TileMap(4, 4, 10.0, 10.0));
  EventList events;
  BuffId timed = buffs::apply(world, BuffSource::Spell, Faction::Light, "conquest",
                              BuffEffects{1.1, 1.0, 1.0, 1.0}, 0.0, 10.0, events);
  buffs::apply(world, BuffSource::DayNight, Faction::Light, "daylight_blessing", BuffEffects{}, 0.0, std::nullopt,
               events);

  events.clear();
  buffs::expire(world, 9.9, events);
  EXPECT_EQ(world.buffs.size(), 2u);

  buffs::expire(world, 10.0, events);
  ASSERT_EQ(world.buffs.size(), 1u);
  const auto* removed = first_event<event::BuffRemoved>(events);
  ASSERT_NE(removed, nullptr);
  EXPECT_EQ(removed->buff, timed);
  EXPECT_EQ(removed->source, BuffSource::Spell);
}
