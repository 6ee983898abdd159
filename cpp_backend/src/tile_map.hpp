#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "config.hpp"
#include "models.hpp"

namespace soulwar {

struct TileRect {
  double left = 0.0;
  double top = 0.0;
  double right = 0.0;
  double bottom = 0.0;
};

// Fixed-size ownership grid. Every cell always holds exactly one faction.
class TileMap {
 public:
  TileMap(int width, int height, double tile_width, double tile_height, Faction fill = Faction::Light);

  // Left half light, right half dark.
  static TileMap split(const config::Config& cfg);

  int width() const {
    return width_;
  }
  int height() const {
    return height_;
  }
  double tile_width() const {
    return tile_width_;
  }
  double tile_height() const {
    return tile_height_;
  }

  bool in_bounds(int x, int y) const {
    return x >= 0 && y >= 0 && x < width_ && y < height_;
  }

  Faction owner(int x, int y) const;
  Faction owner(TileCoord tile) const {
    return owner(tile.x, tile.y);
  }
  void set_owner(int x, int y, Faction faction);

  std::optional<TileCoord> tile_at(double world_x, double world_y) const;
  std::pair<double, double> center(TileCoord tile) const;
  TileRect rect(TileCoord tile) const;

  // Converts the (2r+1)x(2r+1) footprint around `center`, clipped to the map.
  // Returns the tiles whose owner actually changed, in row-major order.
  std::vector<TileCoord> capture(TileCoord center, int radius, Faction faction);

  int count(Faction faction) const;
  const std::vector<Faction>& owners() const {
    return owners_;
  }

 private:
  std::size_t index(int x, int y) const {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x);
  }

  int width_;
  int height_;
  double tile_width_;
  double tile_height_;
  std::vector<Faction> owners_;
};

}  // namespace soulwar
