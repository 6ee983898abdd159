#pragma once

#include <variant>
#include <vector>

#include "config.hpp"
#include "models.hpp"

namespace soulwar {

// Read-only picture of a soul as observers see it.
struct SoulView {
  SoulId id;
  Faction faction = Faction::Light;
  double x = 0.0;
  double y = 0.0;
  double energy = 0.0;
  double max_energy = 0.0;
  SoulState state = SoulState::Roaming;
  bool casting = false;
  bool preparing = false;
  bool defending = false;
  bool retreating = false;
  bool child = false;
  double maturity = 1.0;
  bool mating = false;
  std::optional<SoulId> mating_partner;
  bool sleeping = false;
  double sleep_progress = 0.0;
  bool dead = false;
};

SoulView view_of(const Soul& soul, double now, const config::Config& cfg);

namespace event {

struct SoulSpawned {
  SoulView soul;
};

struct SoulUpdated {
  SoulView soul;
};

struct SoulDeath {
  SoulView soul;
};

struct SoulRemoved {
  SoulId soul;
  Faction faction = Faction::Light;
};

struct SoulMatured {
  SoulView soul;
};

struct Attack {
  SoulId attacker;
  SoulId target;
  double damage = 0.0;
  double attacker_x = 0.0;
  double attacker_y = 0.0;
  double target_x = 0.0;
  double target_y = 0.0;
};

struct SpellStarted {
  ActiveSpell spell;
};

struct SpellInterrupted {
  SpellId spell;
  SoulId caster;
  TileCoord target;
};

struct SpellCompleted {
  SpellId spell;
  SoulId caster;
  TileCoord target;
  Faction faction = Faction::Light;
};

struct TileUpdated {
  TileCoord tile;
  Faction owner = Faction::Light;
};

struct OrbSpawned {
  EnergyOrb orb;
};

struct OrbCollected {
  OrbId orb;
  SoulId collector;
  double energy_gained = 0.0;
  double respawn_at = 0.0;
};

struct MatingStarted {
  SoulId first;
  SoulId second;
  double x = 0.0;
  double y = 0.0;
};

struct MatingCompleted {
  SoulId first;
  SoulId second;
  SoulView child;
};

struct MatingCancelled {
  SoulId first;
  SoulId second;
};

struct DisasterStarted {
  DisasterKind kind = DisasterKind::FreezingSnow;
  double duration = 0.0;
  std::vector<Meteorite> meteorites;
};

struct DisasterEnded {
  DisasterKind kind = DisasterKind::FreezingSnow;
  int killed = 0;
};

struct MeteoriteImpact {
  int meteorite = 0;
  Crater crater;
};

struct NexusAttack {
  SoulId attacker;
  Faction nexus = Faction::Light;
  double damage = 0.0;
  double attacker_x = 0.0;
  double attacker_y = 0.0;
};

struct NexusUpdate {
  Nexus nexus;
};

struct NexusDestroyed {
  Faction nexus = Faction::Light;
  SoulId destroyed_by;
};

struct BuffApplied {
  Buff buff;
};

struct BuffRemoved {
  BuffId buff;
  Faction faction = Faction::Light;
  BuffSource source = BuffSource::DayNight;
};

struct DayNightPhaseChange {
  DayPhase phase = DayPhase::Day;
  DayPhase previous = DayPhase::Day;
  double cycle_progress = 0.0;
};

struct EmergencyRespawn {
  Faction faction = Faction::Light;
  SoulId soul;
};

}  // namespace event

using Event = std::variant<event::SoulSpawned,
                           event::SoulUpdated,
                           event::SoulDeath,
                           event::SoulRemoved,
                           event::SoulMatured,
                           event::Attack,
                           event::SpellStarted,
                           event::SpellInterrupted,
                           event::SpellCompleted,
                           event::TileUpdated,
                           event::OrbSpawned,
                           event::OrbCollected,
                           event::MatingStarted,
                           event::MatingCompleted,
                           event::MatingCancelled,
                           event::DisasterStarted,
                           event::DisasterEnded,
                           event::MeteoriteImpact,
                           event::NexusAttack,
                           event::NexusUpdate,
                           event::NexusDestroyed,
                           event::BuffApplied,
                           event::BuffRemoved,
                           event::DayNightPhaseChange,
                           event::EmergencyRespawn>;

using EventList = std::vector<Event>;

// Wire discriminator, e.g. "spell_started".
const char* event_type(const Event& ev);

}  // namespace soulwar
