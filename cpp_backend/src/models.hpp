#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "util.hpp"

namespace soulwar {

// Typed integer identity. Two ids of different tags never compare.
template <typename Tag>
struct Id {
  std::uint32_t value = 0;

  bool operator==(const Id& other) const {
    return value == other.value;
  }
  bool operator!=(const Id& other) const {
    return value != other.value;
  }
  bool operator<(const Id& other) const {
    return value < other.value;
  }
};

struct SoulTag {};
struct OrbTag {};
struct SpellTag {};
struct BuffTag {};

using SoulId = Id<SoulTag>;
using OrbId = Id<OrbTag>;
using SpellId = Id<SpellTag>;
using BuffId = Id<BuffTag>;

enum class Faction { Light, Dark };

constexpr std::array<Faction, 2> kFactions{Faction::Light, Faction::Dark};

inline Faction opponent(Faction faction) {
  return faction == Faction::Light ? Faction::Dark : Faction::Light;
}

inline const char* faction_name(Faction faction) {
  return faction == Faction::Light ? "light" : "dark";
}

enum class SoulState {
  Roaming,
  Hungry,
  Seeking,
  Preparing,
  Casting,
  Defending,
  Attacking,
  SeekingNexus,
  AttackingNexus,
  Socialising,
  Resting,
  Mating,
};

const char* state_name(SoulState state);

struct TileCoord {
  int x = 0;
  int y = 0;

  bool operator==(const TileCoord& other) const {
    return x == other.x && y == other.y;
  }
  bool operator!=(const TileCoord& other) const {
    return !(*this == other);
  }
  // Row-major order: rows first, then columns.
  bool operator<(const TileCoord& other) const {
    return y != other.y ? y < other.y : x < other.x;
  }
};

struct Soul {
  SoulId id;
  Faction faction = Faction::Light;
  double x = 0.0;
  double y = 0.0;
  double vx = 0.0;
  double vy = 0.0;
  double energy = 0.0;
  double max_energy = 100.0;

  bool child = false;
  double born_at = 0.0;

  SoulState state = SoulState::Roaming;
  SoulState previous_state = SoulState::Roaming;
  double state_started_at = 0.0;
  double last_cast_at = -1e9;

  double last_attack_at = -1e9;
  double last_attacked_at = -1e9;
  bool retreating = false;

  std::optional<TileCoord> pending_target;
  std::optional<SoulId> defend_target;

  std::optional<SoulId> mating_partner;
  std::optional<double> mating_started_at;
  double last_mating_at = -1e9;
  bool ready_to_complete_mating = false;

  bool sleeping = false;
  double sleep_started_at = 0.0;
  // Index of the day/night cycle in which this soul last slept.
  long last_sleep_cycle = -1;

  bool dead = false;
  bool death_started = false;
  double death_started_at = 0.0;

  std::deque<std::pair<double, double>> position_history;

  bool is_casting() const {
    return state == SoulState::Casting;
  }
  bool is_preparing() const {
    return state == SoulState::Preparing;
  }
  bool is_defending() const {
    return state == SoulState::Defending || state == SoulState::Attacking;
  }
  bool is_mating() const {
    return state == SoulState::Mating;
  }
  bool is_alive() const {
    return !dead;
  }

  double energy_fraction() const {
    return max_energy > 0.0 ? energy / max_energy : 0.0;
  }

  void add_energy(double amount) {
    energy = clamp(energy + amount, 0.0, max_energy);
  }

  void remove_energy(double amount) {
    energy = clamp(energy - amount, 0.0, max_energy);
    if (energy <= 0.0) {
      dead = true;
    }
  }

  double maturity(double now, double maturity_time) const {
    if (!child) {
      return 1.0;
    }
    if (maturity_time <= 0.0) {
      return 1.0;
    }
    return clamp((now - born_at) / maturity_time, 0.0, 1.0);
  }

  bool is_adult(double now, double maturity_time) const {
    return maturity(now, maturity_time) >= 1.0;
  }

  double time_in_state(double now) const {
    return now - state_started_at;
  }

  double sleep_progress(double now, double duration) const {
    if (!sleeping || duration <= 0.0) {
      return 0.0;
    }
    return clamp((now - sleep_started_at) / duration, 0.0, 1.0);
  }

  // Enter a new state, clearing the per-state bookkeeping that does not
  // survive the transition.
  void transition_to(SoulState next, double now);
};

struct EnergyOrb {
  OrbId id;
  Faction faction = Faction::Light;
  double x = 0.0;
  double y = 0.0;
  double energy = 0.0;
  double respawn_at = 0.0;

  bool available(double now) const {
    return respawn_at <= now;
  }
};

struct Nexus {
  Faction faction = Faction::Light;
  TileCoord tile;
  double x = 0.0;
  double y = 0.0;
  double health = 0.0;
  double max_health = 0.0;
  double last_regen_at = 0.0;
  bool destroyed = false;

  // Returns true if this hit destroyed the nexus.
  bool take_damage(double amount) {
    if (destroyed) {
      return false;
    }
    health = std::max(0.0, health - amount);
    if (health <= 0.0) {
      destroyed = true;
      return true;
    }
    return false;
  }
};

struct ActiveSpell {
  SpellId id;
  SoulId caster;
  Faction faction = Faction::Light;
  TileCoord target;
  double started_at = 0.0;
  double completes_at = 0.0;
  double caster_x = 0.0;
  double caster_y = 0.0;
  double target_x = 0.0;
  double target_y = 0.0;

  double duration() const {
    return completes_at - started_at;
  }
};

enum class BuffSource { DayNight, Disaster, Spell };

inline const char* buff_source_name(BuffSource source) {
  switch (source) {
    case BuffSource::DayNight:
      return "daynight";
    case BuffSource::Disaster:
      return "disaster";
    case BuffSource::Spell:
      return "spell";
  }
  return "unknown";
}

struct BuffEffects {
  double speed = 1.0;
  double cast_time = 1.0;
  double energy = 1.0;
  double damage = 1.0;
};

struct Buff {
  BuffId id;
  BuffSource source = BuffSource::DayNight;
  std::string name;
  Faction faction = Faction::Light;
  BuffEffects effects;
  double applied_at = 0.0;
  std::optional<double> expires_at;
};

enum class DayPhase { Day, Dusk, Night, Dawn };

inline const char* day_phase_name(DayPhase phase) {
  switch (phase) {
    case DayPhase::Day:
      return "day";
    case DayPhase::Dusk:
      return "dusk";
    case DayPhase::Night:
      return "night";
    case DayPhase::Dawn:
      return "dawn";
  }
  return "unknown";
}

enum class DisasterKind { FreezingSnow, MeteoriteStorm };

inline const char* disaster_name(DisasterKind kind) {
  return kind == DisasterKind::FreezingSnow ? "freezing_snow" : "meteorite_storm";
}

struct Meteorite {
  int id = 0;
  double start_x = 0.0;
  double start_y = 0.0;
  double target_x = 0.0;
  double target_y = 0.0;
  // Seconds after the disaster start at which this meteorite lands.
  double impact_offset = 0.0;
  bool landed = false;
};

struct Crater {
  double x = 0.0;
  double y = 0.0;
  double size = 0.0;
  double created_at = 0.0;
};

}  // namespace soulwar

namespace std {

template <typename Tag>
struct hash<soulwar::Id<Tag>> {
  std::size_t operator()(const soulwar::Id<Tag>& id) const noexcept {
    return std::hash<std::uint32_t>{}(id.value);
  }
};

}  // namespace std
