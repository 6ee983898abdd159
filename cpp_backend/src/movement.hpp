#pragma once

#include <optional>
#include <utility>

#include "config.hpp"
#include "spatial_grid.hpp"
#include "spell.hpp"
#include "world_state.hpp"

namespace soulwar {

struct MoveTarget {
  double x = 0.0;
  double y = 0.0;
  // Close enough once within this distance of the target.
  double arrive_radius = 0.0;
};

class MovementSystem {
 public:
  MovementSystem(const config::Config& cfg, const SpellSystem& spells, Rng& rng);

  // Moves every living soul for one tick, then separates overlapping souls.
  void update(WorldState& world, double now);

  void move_soul(WorldState& world, Soul& soul, double now);
  void resolve_collisions(WorldState& world);

  // Inside the world buffer, on an own tile, and clear of every enemy tile
  // within the check radius by at least the barrier distance.
  bool is_valid_position(const TileMap& tiles, double x, double y, Faction faction) const;

  std::optional<MoveTarget> target_for(const WorldState& world, const Soul& soul, double now) const;

  // Direct segment to (tx, ty) crosses an invalid point.
  bool path_blocked(const TileMap& tiles, const Soul& soul, double tx, double ty) const;
  bool is_stuck(const Soul& soul) const;
  int open_neighbors(const TileMap& tiles, const Soul& soul) const;

 private:
  double speed_of(const WorldState& world, const Soul& soul) const;

  std::optional<MoveTarget> defend_target(const WorldState& world, const Soul& soul) const;
  std::optional<MoveTarget> retreat_target(const WorldState& world, const Soul& soul) const;
  std::optional<MoveTarget> nearest_orb(const WorldState& world, const Soul& soul, double now) const;
  std::optional<MoveTarget> enemy_nexus(const WorldState& world, const Soul& soul) const;

  void move_mating(WorldState& world, Soul& soul, double speed);
  void navigate(const TileMap& tiles, Soul& soul, const MoveTarget& target, double speed);
  bool tunnel_step(const TileMap& tiles, Soul& soul, const MoveTarget& target, double speed);
  bool directional_step(const TileMap& tiles, Soul& soul, const MoveTarget& target, double speed);
  bool escape_step(const TileMap& tiles, Soul& soul, double speed);
  void wander(const TileMap& tiles, Soul& soul, double speed);
  bool step_to(const TileMap& tiles, Soul& soul, double x, double y);

  const config::Config& cfg_;
  const SpellSystem& spells_;
  Rng& rng_;
  SpatialGrid<SoulId> soul_grid_;
};

}  // namespace soulwar
