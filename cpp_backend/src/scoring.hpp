#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "config.hpp"
#include "models.hpp"
#include "tile_map.hpp"

namespace soulwar {

// Frontier rectangle spanning both nexuses, in tile coordinates.
struct BorderRect {
  int left = 0;
  int top = 0;
  int right = 0;
  int bottom = 0;
};

// Per-faction desirability of every tile. A tile scores zero when the
// faction owns it, when it lies outside the faction's two border sides, or
// when it is part of the enemy nexus; otherwise the score is the Manhattan
// distance to the enemy nexus footprint, so tiles far from the enemy core
// are preferred and the front advances one step at a time.
class ScoringSystem {
 public:
  ScoringSystem(const config::Config& cfg, const TileMap& tiles);

  void recompute();

  int score(int x, int y, Faction faction) const;
  int score(TileCoord tile, Faction faction) const {
    return score(tile.x, tile.y, faction);
  }

  // Highest scoring tile not rejected by `excluded`. Equal scores resolve to
  // the first tile in row-major order.
  std::optional<TileCoord> best_tile(Faction faction,
                                     const std::function<bool(TileCoord)>& excluded = nullptr) const;

  bool has_capturable(Faction faction, const std::function<bool(TileCoord)>& excluded = nullptr) const;

  const BorderRect& border() const {
    return border_;
  }
  int band_x() const {
    return band_x_;
  }
  int band_y() const {
    return band_y_;
  }

  TileCoord nexus_tile(Faction faction) const;
  bool in_nexus_footprint(int x, int y, Faction nexus_owner) const;
  int distance_to_nexus(int x, int y, Faction nexus_owner) const;
  bool on_border_band(int x, int y, Faction faction) const;

 private:
  int compute(int x, int y, Faction faction) const;
  std::vector<int>& matrix(Faction faction) {
    return faction == Faction::Light ? light_scores_ : dark_scores_;
  }
  const std::vector<int>& matrix(Faction faction) const {
    return faction == Faction::Light ? light_scores_ : dark_scores_;
  }

  const config::Config& cfg_;
  const TileMap& tiles_;
  int band_x_;
  int band_y_;
  BorderRect border_;
  std::vector<int> light_scores_;
  std::vector<int> dark_scores_;
};

}  // namespace soulwar
