#include "scoring.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace soulwar {

ScoringSystem::ScoringSystem(const config::Config& cfg, const TileMap& tiles)
    : cfg_(cfg),
      tiles_(tiles),
      band_x_(static_cast<int>(std::ceil(cfg.border_band / cfg.tile_width))),
      band_y_(static_cast<int>(std::ceil(cfg.border_band / cfg.tile_height))) {
  int half_x = band_x_ / 2;
  int half_y = band_y_ / 2;
  TileCoord light = nexus_tile(Faction::Light);
  TileCoord dark = nexus_tile(Faction::Dark);
  border_.left = std::min(light.x, dark.x) - half_x;
  border_.right = std::max(light.x, dark.x) + half_x;
  border_.top = std::min(light.y, dark.y) - half_y;
  border_.bottom = std::max(light.y, dark.y) + half_y;

  std::size_t cells = static_cast<std::size_t>(tiles_.width()) * static_cast<std::size_t>(tiles_.height());
  light_scores_.assign(cells, 0);
  dark_scores_.assign(cells, 0);
  recompute();
}

TileCoord ScoringSystem::nexus_tile(Faction faction) const {
  if (faction == Faction::Light) {
    return {cfg_.light_nexus_tile_x, cfg_.light_nexus_tile_y};
  }
  return {cfg_.dark_nexus_tile_x, cfg_.dark_nexus_tile_y};
}

bool ScoringSystem::in_nexus_footprint(int x, int y, Faction nexus_owner) const {
  TileCoord center = nexus_tile(nexus_owner);
  int half = cfg_.nexus_size / 2;
  int min_x = center.x - half;
  int min_y = center.y - half;
  return x >= min_x && x < min_x + cfg_.nexus_size && y >= min_y && y < min_y + cfg_.nexus_size;
}

int ScoringSystem::distance_to_nexus(int x, int y, Faction nexus_owner) const {
  TileCoord center = nexus_tile(nexus_owner);
  int half = cfg_.nexus_size / 2;
  int min_x = center.x - half;
  int max_x = min_x + cfg_.nexus_size - 1;
  int min_y = center.y - half;
  int max_y = min_y + cfg_.nexus_size - 1;
  // Manhattan distance to the closest footprint cell.
  int dx = x < min_x ? min_x - x : (x > max_x ? x - max_x : 0);
  int dy = y < min_y ? min_y - y : (y > max_y ? y - max_y : 0);
  return dx + dy;
}

bool ScoringSystem::on_border_band(int x, int y, Faction faction) const {
  if (x < border_.left || x > border_.right || y < border_.top || y > border_.bottom) {
    return false;
  }
  if (faction == Faction::Light) {
    return y <= border_.top + band_y_ || x <= border_.left + band_x_;
  }
  return x >= border_.right - band_x_ || y >= border_.bottom - band_y_;
}

int ScoringSystem::compute(int x, int y, Faction faction) const {
  if (tiles_.owner(x, y) == faction) {
    return 0;
  }
  Faction enemy = opponent(faction);
  if (in_nexus_footprint(x, y, enemy)) {
    return 0;
  }
  if (!on_border_band(x, y, faction)) {
    return 0;
  }
  return distance_to_nexus(x, y, enemy);
}

void ScoringSystem::recompute() {
  for (Faction faction : kFactions) {
    auto& scores = matrix(faction);
    for (int y = 0; y < tiles_.height(); ++y) {
      for (int x = 0; x < tiles_.width(); ++x) {
        scores[static_cast<std::size_t>(y) * static_cast<std::size_t>(tiles_.width()) + static_cast<std::size_t>(x)] =
            compute(x, y, faction);
      }
    }
  }
}

int ScoringSystem::score(int x, int y, Faction faction) const {
  if (!tiles_.in_bounds(x, y)) {
    return 0;
  }
  return matrix(faction)[static_cast<std::size_t>(y) * static_cast<std::size_t>(tiles_.width()) +
                         static_cast<std::size_t>(x)];
}

std::optional<TileCoord> ScoringSystem::best_tile(Faction faction,
                                                  const std::function<bool(TileCoord)>& excluded) const {
  std::optional<TileCoord> best;
  int best_score = 0;
  for (int y = 0; y < tiles_.height(); ++y) {
    for (int x = 0; x < tiles_.width(); ++x) {
      int value = score(x, y, faction);
      // Strictly greater keeps the first tile in row-major order on ties.
      if (value <= best_score) {
        continue;
      }
      if (excluded && excluded({x, y})) {
        continue;
      }
      best_score = value;
      best = TileCoord{x, y};
    }
  }
  return best;
}

bool ScoringSystem::has_capturable(Faction faction, const std::function<bool(TileCoord)>& excluded) const {
  for (int y = 0; y < tiles_.height(); ++y) {
    for (int x = 0; x < tiles_.width(); ++x) {
      if (score(x, y, faction) > 0 && !(excluded && excluded({x, y}))) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace soulwar
