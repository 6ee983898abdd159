#include <gtest/gtest.h>

#include "combat.hpp"
#include "spell.hpp"
#include "test_support.hpp"

using namespace soulwar;
using soulwar::testing::WorldFixture;
using soulwar::testing::count_events;
using soulwar::testing::first_event;
using soulwar::testing::quiet_config;

namespace {

config::Config long_range_config() {
  config::Config cfg = quiet_config();
  cfg.spell_range = 150.0;
  return cfg;
}

}  // namespace

TEST(SpellTest, CastDurationFollowsPhaseBuff) {
  WorldFixture fx;
  EXPECT_DOUBLE_EQ(fx.world.spells().cast_duration(fx.world.state(), Faction::Light), 3.0 * 0.8);
  EXPECT_DOUBLE_EQ(fx.world.spells().cast_duration(fx.world.state(), Faction::Dark), 3.0);
}

TEST(SpellTest, PendingTargetClaimsTile) {
  WorldFixture fx;
  Soul& first = fx.adult(Faction::Light, 700.0, 187.5);
  Soul& second = fx.adult(Faction::Light, 700.0, 250.0);
  first.transition_to(SoulState::Preparing, 0.0);
  first.pending_target = TileCoord{30, 12};

  auto& spells = fx.world.spells();
  EXPECT_FALSE(spells.is_tile_claimed(fx.world.state(), {30, 12}, first.id));
  EXPECT_TRUE(spells.is_tile_claimed(fx.world.state(), {30, 12}, second.id));

  auto target = spells.best_target(fx.world.state(), second);
  ASSERT_TRUE(target.has_value());
  EXPECT_NE(*target, (TileCoord{30, 12}));
}

TEST(SpellTest, InRangeRespectsMinimumDistance) {
  WorldFixture fx;
  Soul& near = fx.adult(Faction::Light, 740.0, 187.5);
  Soul& ok = fx.adult(Faction::Light, 700.0, 187.5);
  EXPECT_FALSE(fx.world.spells().in_range(fx.world.state(), near, {30, 12}));
  EXPECT_TRUE(fx.world.spells().in_range(fx.world.state(), ok, {30, 12}));
}

TEST(SpellTest, FallbackAcceptsNearestTileAfterHalfTheTimeout) {
  WorldFixture fx;
  Soul& soul = fx.adult(Faction::Light, 700.0, 450.0);
  soul.transition_to(SoulState::Seeking, 0.0);
  auto& spells = fx.world.spells();

  EXPECT_FALSE(spells.find_cast_target(fx.world.state(), soul, 7.0).has_value());
  auto target = spells.find_cast_target(fx.world.state(), soul, 7.5);
  ASSERT_TRUE(target.has_value());
  EXPECT_EQ(target->x, 30);
  EXPECT_TRUE(spells.in_range(fx.world.state(), soul, *target));
}

TEST(SpellTest, SecondCasterOnSameTileStandsDown) {
  WorldFixture fx;
  Soul& first = fx.adult(Faction::Dark, 877.5, 712.5);
  Soul& second = fx.adult(Faction::Dark, 877.5, 650.0);
  for (Soul* soul : {&first, &second}) {
    soul->transition_to(SoulState::Casting, 1.0);
    soul->pending_target = TileCoord{29, 47};
  }
  fx.events.clear();
  fx.world.spells().update(fx.world.state(), 1.0, fx.events);

  EXPECT_EQ(count_events<event::SpellStarted>(fx.events), 1);
  EXPECT_EQ(fx.world.state().spells.size(), 1u);
  EXPECT_NE(fx.world.state().spell_by_caster(first.id), nullptr);
  EXPECT_EQ(second.state, SoulState::Roaming);
  EXPECT_DOUBLE_EQ(first.energy, 75.0);
  EXPECT_DOUBLE_EQ(second.energy, 100.0);
}

TEST(SpellTest, CompletedCastCapturesFootprintAndConsumesCaster) {
  WorldFixture fx(long_range_config());
  Soul& soul = fx.adult(Faction::Dark, 877.5, 712.5);
  soul.transition_to(SoulState::Seeking, 0.0);
  SoulId id = soul.id;

  fx.tick_at(0.5);
  fx.tick_at(1.5);
  ASSERT_EQ(fx.world.state().spells.size(), 1u);
  const ActiveSpell& spell = fx.world.state().spells.begin()->second;
  EXPECT_DOUBLE_EQ(spell.completes_at, 4.5);
  EXPECT_EQ(spell.target, (TileCoord{29, 47}));

  fx.tick_at(3.0);
  EXPECT_EQ(fx.world.state().souls.at(id).state, SoulState::Casting);

  fx.tick_at(4.5);
  const auto* done = first_event<event::SpellCompleted>(fx.events);
  ASSERT_NE(done, nullptr);
  EXPECT_EQ(done->caster, id);
  EXPECT_EQ(count_events<event::TileUpdated>(fx.events), 6);
  EXPECT_EQ(fx.world.state().tiles.owner(28, 46), Faction::Dark);
  EXPECT_EQ(fx.world.state().tiles.owner(29, 48), Faction::Dark);
  EXPECT_EQ(fx.world.state().tiles.owner(27, 47), Faction::Light);
  EXPECT_TRUE(fx.world.state().spells.empty());
  EXPECT_TRUE(fx.world.state().souls.at(id).dead);
  EXPECT_EQ(fx.world.scoring().score(29, 47, Faction::Dark), 0);

  const auto* conquest = first_event<event::BuffApplied>(fx.events);
  ASSERT_NE(conquest, nullptr);
  EXPECT_EQ(conquest->buff.name, "conquest");
  EXPECT_EQ(conquest->buff.faction, Faction::Dark);

  fx.tick_at(4.75);
  EXPECT_EQ(count_events<event::SoulDeath>(fx.events), 1);
}

TEST(SpellTest, DeadCasterAtCompletionCapturesNothing) {
  WorldFixture fx;
  Soul& soul = fx.adult(Faction::Dark, 877.5, 712.5);
  soul.transition_to(SoulState::Casting, 1.0);
  soul.pending_target = TileCoord{29, 47};
  fx.events.clear();
  fx.world.spells().update(fx.world.state(), 1.0, fx.events);
  ASSERT_EQ(fx.world.state().spells.size(), 1u);

  soul.dead = true;
  fx.events.clear();
  fx.world.spells().complete_due(fx.world.state(), 4.0, fx.events);
  EXPECT_EQ(count_events<event::SpellInterrupted>(fx.events), 1);
  EXPECT_EQ(count_events<event::TileUpdated>(fx.events), 0);
  EXPECT_EQ(fx.world.state().tiles.owner(29, 47), Faction::Light);
  EXPECT_TRUE(fx.world.state().spells.empty());
}

TEST(CombatTest, AttackDuringCastInterruptsSpell) {
  WorldFixture fx(long_range_config());
  Soul& caster = fx.adult(Faction::Dark, 877.5, 712.5);
  caster.transition_to(SoulState::Seeking, 0.0);
  SoulId caster_id = caster.id;
  fx.tick_at(0.5);
  fx.tick_at(1.5);
  ASSERT_EQ(fx.world.state().spells.size(), 1u);

  SoulId defender_id = fx.adult(Faction::Light, 700.0, 712.5).id;
  fx.tick_at(2.0);

  const auto* hit = first_event<event::Attack>(fx.events);
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(hit->attacker, defender_id);
  EXPECT_EQ(hit->target, caster_id);
  EXPECT_GE(hit->damage, fx.cfg.attack_damage_min);
  EXPECT_LE(hit->damage, fx.cfg.attack_damage_max);
  EXPECT_EQ(count_events<event::SpellInterrupted>(fx.events), 1);
  EXPECT_EQ(count_events<event::SpellCompleted>(fx.events), 0);

  const WorldState& state = fx.world.state();
  EXPECT_TRUE(state.spells.empty());
  EXPECT_EQ(state.tiles.owner(29, 47), Faction::Light);
  EXPECT_EQ(state.souls.at(caster_id).state, SoulState::Roaming);
  EXPECT_TRUE(state.souls.at(caster_id).retreating);
  EXPECT_DOUBLE_EQ(state.souls.at(caster_id).energy, 75.0 - hit->damage);
  EXPECT_EQ(state.souls.at(defender_id).state, SoulState::Roaming);
}

TEST(CombatTest, AttackOnCompletionTickWinsWhateverTheIdOrder) {
  for (bool defender_first : {true, false}) {
    WorldFixture fx;
    SoulId defender_id;
    if (defender_first) {
      defender_id = fx.adult(Faction::Light, 700.0, 712.5).id;
    }
    Soul& caster = fx.adult(Faction::Dark, 877.5, 712.5);
    SoulId caster_id = caster.id;
    if (!defender_first) {
      defender_id = fx.adult(Faction::Light, 700.0, 712.5).id;
    }

    caster.transition_to(SoulState::Casting, 1.5);
    caster.pending_target = TileCoord{29, 47};
    fx.world.spells().update(fx.world.state(), 1.5, fx.events);
    ASSERT_EQ(fx.world.state().spells.size(), 1u);
    double completes_at = fx.world.state().spells.begin()->second.completes_at;
    EXPECT_DOUBLE_EQ(completes_at, 4.5);

    Soul& defender = fx.world.state().souls.at(defender_id);
    defender.transition_to(SoulState::Attacking, 4.0);
    defender.defend_target = caster_id;

    fx.tick_at(completes_at);
    EXPECT_EQ(count_events<event::Attack>(fx.events), 1) << "defender_first=" << defender_first;
    EXPECT_EQ(count_events<event::SpellInterrupted>(fx.events), 1) << "defender_first=" << defender_first;
    EXPECT_EQ(count_events<event::SpellCompleted>(fx.events), 0) << "defender_first=" << defender_first;
    EXPECT_EQ(fx.world.state().tiles.owner(29, 47), Faction::Light);
    EXPECT_FALSE(fx.world.state().souls.at(caster_id).dead);
    EXPECT_EQ(fx.world.state().souls.at(caster_id).state, SoulState::Roaming);
  }
}

TEST(CombatTest, AttackCooldownIsEnforced) {
  WorldFixture fx;
  Soul& attacker = fx.adult(Faction::Light, 700.0, 450.0);
  Soul& target = fx.adult(Faction::Dark, 850.0, 450.0);
  auto& combat = fx.world.combat();
  EXPECT_TRUE(combat.can_attack(attacker, 1.0));
  combat.attack(fx.world.state(), attacker, target, 1.0, fx.events);
  EXPECT_FALSE(combat.can_attack(attacker, 2.5));
  EXPECT_TRUE(combat.can_attack(attacker, 3.0));
}

TEST(CombatTest, RetreatingSoulCannotAttack) {
  WorldFixture fx;
  Soul& soul = fx.adult(Faction::Light, 700.0, 450.0);
  soul.retreating = true;
  EXPECT_FALSE(fx.world.combat().can_attack(soul, 1.0));
}

TEST(CombatTest, DefenderTiesResolveToLowestId) {
  WorldFixture fx;
  Soul& first = fx.adult(Faction::Light, 600.0, 600.0, 80.0);
  fx.adult(Faction::Light, 600.0, 700.0, 80.0);
  Soul& caster = fx.adult(Faction::Dark, 877.5, 712.5);
  caster.transition_to(SoulState::Casting, 0.0);

  auto chosen = CombatSystem::select_defender(fx.world.state(), caster, 0.0, fx.cfg);
  ASSERT_TRUE(chosen.has_value());
  EXPECT_EQ(*chosen, first.id);
}

TEST(CombatTest, NoDefenderForIdleEnemy) {
  WorldFixture fx;
  fx.adult(Faction::Light, 600.0, 600.0);
  Soul& idle = fx.adult(Faction::Dark, 877.5, 712.5);
  EXPECT_FALSE(CombatSystem::select_defender(fx.world.state(), idle, 0.0, fx.cfg).has_value());
}

TEST(CombatTest, NexusFallsWhenHealthRunsOut) {
  WorldFixture fx;
  Nexus* nexus = fx.world.state().nexus(Faction::Dark);
  ASSERT_NE(nexus, nullptr);
  nexus->health = 10.0;
  Soul& attacker = fx.adult(Faction::Light, nexus->x - 100.0, nexus->y);
  fx.events.clear();
  fx.world.combat().attack_nexus(fx.world.state(), attacker, *nexus, 1.0, fx.events);

  EXPECT_TRUE(nexus->destroyed);
  EXPECT_DOUBLE_EQ(nexus->health, 0.0);
  EXPECT_EQ(count_events<event::NexusAttack>(fx.events), 1);
  const auto* fallen = first_event<event::NexusDestroyed>(fx.events);
  ASSERT_NE(fallen, nullptr);
  EXPECT_EQ(fallen->nexus, Faction::Dark);
  EXPECT_EQ(fallen->destroyed_by, attacker.id);

  fx.events.clear();
  fx.world.combat().attack_nexus(fx.world.state(), attacker, *nexus, 5.0, fx.events);
  EXPECT_EQ(count_events<event::NexusDestroyed>(fx.events), 0);
}
