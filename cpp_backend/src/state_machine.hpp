#pragma once

#include "config.hpp"
#include "day_night.hpp"
#include "events.hpp"
#include "spell.hpp"
#include "world_state.hpp"

namespace soulwar {

// Behavior controller. The per-soul state lives on the Soul itself; this
// class holds the transition rules and evaluates them once per tick, highest
// priority first within each state.
class SoulStateMachine {
 public:
  SoulStateMachine(const config::Config& cfg, const SpellSystem& spells, const DayNightSystem& day_night);

  void update(WorldState& world, Soul& soul, double now, EventList& events);

  // Souls of the faction committed to an offensive: seeking a tile, casting,
  // or marching on the enemy nexus.
  static int offensive_count(const WorldState& world, Faction faction);

  // How many more souls of the faction may start seeking.
  int seek_allowance(const WorldState& world, Faction faction, double now) const;

  bool can_seek(const WorldState& world, const Soul& soul, double now) const;
  bool should_sleep(const Soul& soul, double now) const;

 private:
  bool is_hungry(const Soul& soul) const {
    return soul.energy_fraction() < cfg_.hungry_threshold;
  }

  bool try_defend(WorldState& world, Soul& soul, double now);
  bool enemy_nexus_alive(const WorldState& world, const Soul& soul) const;

  void on_roaming(WorldState& world, Soul& soul, double now);
  void on_hungry(WorldState& world, Soul& soul, double now);
  void on_seeking(WorldState& world, Soul& soul, double now);
  void on_preparing(WorldState& world, Soul& soul, double now);
  void on_casting(WorldState& world, Soul& soul, double now);
  void on_defending(WorldState& world, Soul& soul, double now);
  void on_attacking(WorldState& world, Soul& soul, double now);
  void on_seeking_nexus(WorldState& world, Soul& soul, double now);
  void on_attacking_nexus(WorldState& world, Soul& soul, double now);
  void on_resting(Soul& soul, double now);
  void on_mating(WorldState& world, Soul& soul, double now, EventList& events);

  const config::Config& cfg_;
  const SpellSystem& spells_;
  const DayNightSystem& day_night_;
};

}  // namespace soulwar
