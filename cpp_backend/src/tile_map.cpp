#include "tile_map.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace soulwar {

TileMap::TileMap(int width, int height, double tile_width, double tile_height, Faction fill)
    : width_(width),
      height_(height),
      tile_width_(tile_width),
      tile_height_(tile_height) {
  if (width <= 0 || height <= 0 || tile_width <= 0.0 || tile_height <= 0.0) {
    throw std::invalid_argument("tile map dimensions must be positive");
  }
  owners_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), fill);
}

TileMap TileMap::split(const config::Config& cfg) {
  TileMap map(cfg.tiles_x, cfg.tiles_y, cfg.tile_width, cfg.tile_height, Faction::Light);
  for (int y = 0; y < map.height_; ++y) {
    for (int x = 0; x < map.width_; ++x) {
      if (x * map.tile_width_ >= cfg.world_width * 0.5) {
        map.set_owner(x, y, Faction::Dark);
      }
    }
  }
  return map;
}

Faction TileMap::owner(int x, int y) const {
  return owners_.at(index(x, y));
}

void TileMap::set_owner(int x, int y, Faction faction) {
  if (!in_bounds(x, y)) {
    return;
  }
  owners_[index(x, y)] = faction;
}

std::optional<TileCoord> TileMap::tile_at(double world_x, double world_y) const {
  int x = static_cast<int>(std::floor(world_x / tile_width_));
  int y = static_cast<int>(std::floor(world_y / tile_height_));
  if (!in_bounds(x, y)) {
    return std::nullopt;
  }
  return TileCoord{x, y};
}

std::pair<double, double> TileMap::center(TileCoord tile) const {
  return {(tile.x + 0.5) * tile_width_, (tile.y + 0.5) * tile_height_};
}

TileRect TileMap::rect(TileCoord tile) const {
  TileRect out;
  out.left = tile.x * tile_width_;
  out.top = tile.y * tile_height_;
  out.right = out.left + tile_width_;
  out.bottom = out.top + tile_height_;
  return out;
}

std::vector<TileCoord> TileMap::capture(TileCoord center, int radius, Faction faction) {
  std::vector<TileCoord> changed;
  for (int y = std::max(0, center.y - radius); y <= std::min(height_ - 1, center.y + radius); ++y) {
    for (int x = std::max(0, center.x - radius); x <= std::min(width_ - 1, center.x + radius); ++x) {
      std::size_t i = index(x, y);
      if (owners_[i] == faction) {
        continue;
      }
      owners_[i] = faction;
      changed.push_back({x, y});
    }
  }
  return changed;
}

int TileMap::count(Faction faction) const {
  return static_cast<int>(std::count(owners_.begin(), owners_.end(), faction));
}

}  // namespace soulwar
