#pragma once

#include <optional>

#include "config.hpp"
#include "events.hpp"
#include "scoring.hpp"
#include "world_state.hpp"

namespace soulwar {

class SpellSystem {
 public:
  SpellSystem(const config::Config& cfg, ScoringSystem& scoring);

  // True when an active spell targets `tile`, or another living soul holds it
  // as its pending target.
  bool is_tile_claimed(const WorldState& world, TileCoord tile, SoulId except) const;

  // Best scoring tile for the soul's faction that nobody else has claimed.
  std::optional<TileCoord> best_target(const WorldState& world, const Soul& soul) const;

  bool has_capturable(const WorldState& world, const Soul& soul) const;

  bool in_range(const WorldState& world, const Soul& soul, TileCoord tile) const;

  // Tile a seeking soul may commit to right now, if any. Prefers the best
  // target; once the soul has been seeking for the fallback share of the
  // seeking timeout, the nearest in-range enemy tile is accepted too.
  std::optional<TileCoord> find_cast_target(const WorldState& world, const Soul& soul, double now) const;

  double cast_duration(const WorldState& world, Faction faction) const;

  // Opens a spell for every casting soul that does not have one yet.
  void update(WorldState& world, double now, EventList& events);

  // Resolves spells whose cast time has elapsed. Runs after combat.
  void complete_due(WorldState& world, double now, EventList& events);

  // Cancels the soul's spell and pending cast. Returns false when there was
  // nothing to interrupt.
  bool interrupt(WorldState& world, SoulId caster, double now, EventList& events);

  void handle_death(WorldState& world, SoulId soul, double now, EventList& events);

 private:
  void stand_down_defenders(WorldState& world, SoulId caster, double now);
  void complete(WorldState& world, const ActiveSpell& spell, double now, EventList& events);

  const config::Config& cfg_;
  ScoringSystem& scoring_;
};

}  // namespace soulwar
