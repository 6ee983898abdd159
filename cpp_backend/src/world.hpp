#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "clock.hpp"
#include "combat.hpp"
#include "config.hpp"
#include "day_night.hpp"
#include "disaster.hpp"
#include "events.hpp"
#include "mating.hpp"
#include "models.hpp"
#include "movement.hpp"
#include "scoring.hpp"
#include "spell.hpp"
#include "state_machine.hpp"
#include "world_state.hpp"

namespace soulwar {

// Full picture of the world for observers joining or resyncing.
struct WorldSnapshot {
  double time = 0.0;
  long tick = 0;
  double world_width = 0.0;
  double world_height = 0.0;
  int tiles_x = 0;
  int tiles_y = 0;
  double tile_width = 0.0;
  double tile_height = 0.0;
  // Row-major tile owners.
  std::vector<Faction> tiles;
  std::vector<SoulView> souls;
  std::vector<EnergyOrb> orbs;
  std::vector<Nexus> nexuses;
  std::vector<ActiveSpell> spells;
  std::vector<Buff> buffs;
  PhaseInfo day_night;
  std::optional<ActiveDisaster> disaster;
  std::vector<Crater> craters;
};

// Owns the world state and every subsystem, and runs them in a fixed order
// once per tick. Not thread-safe; the server serializes access.
class GameWorld {
 public:
  GameWorld(const config::Config& cfg, const Clock& clock);

  GameWorld(const GameWorld&) = delete;
  GameWorld& operator=(const GameWorld&) = delete;

  // Advances the simulation one tick at the clock's current time and returns
  // the events it produced, in emission order.
  EventList update();

  Soul& spawn_soul(Faction faction, double x, double y, bool child = false);
  EnergyOrb& spawn_orb(Faction faction, double x, double y);

  WorldSnapshot snapshot() const;

  WorldState& state() {
    return state_;
  }
  const WorldState& state() const {
    return state_;
  }

  const config::Config& config() const {
    return cfg_;
  }
  long tick() const {
    return tick_;
  }

  ScoringSystem& scoring() {
    return scoring_;
  }
  SpellSystem& spells() {
    return spells_;
  }
  CombatSystem& combat() {
    return combat_;
  }
  MovementSystem& movement() {
    return movement_;
  }
  MatingSystem& mating() {
    return mating_;
  }
  const DayNightSystem& day_night() const {
    return day_night_;
  }
  SoulStateMachine& state_machine() {
    return machine_;
  }
  DisasterSystem& disasters() {
    return disasters_;
  }

 private:
  void init_nexuses(double now);
  void spawn_initial(double now);
  Soul& add_soul(Faction faction, double x, double y, bool child, double now, EventList& events);
  EnergyOrb& add_orb(Faction faction, double x, double y, EventList& events);

  void update_souls(double now, EventList& events);
  void handle_deaths(double now, EventList& events);
  void collect_orbs(double now, EventList& events);
  void respawn_orbs(double now, EventList& events);
  void regenerate_nexuses(double now, EventList& events);
  void emergency_respawn(double now, EventList& events);

  std::pair<double, double> nexus_spawn_position(Faction faction);
  std::pair<double, double> orb_spawn_position(Faction faction);

  const config::Config& cfg_;
  const Clock& clock_;
  Rng rng_;
  WorldState state_;
  ScoringSystem scoring_;
  SpellSystem spells_;
  CombatSystem combat_;
  MovementSystem movement_;
  MatingSystem mating_;
  DayNightSystem day_night_;
  SoulStateMachine machine_;
  DisasterSystem disasters_;
  // Events raised outside update(), delivered with the next batch.
  EventList pending_;
  long tick_ = 0;
};

}  // namespace soulwar
