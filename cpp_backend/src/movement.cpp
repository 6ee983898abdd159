#include "movement.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

#include "buffs.hpp"
#include "soul.hpp"

namespace soulwar {
namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kSeekArriveFactor = 0.8;
constexpr double kWanderSpeedFactor = 0.5;
constexpr double kMatingSpeedFactor = 0.5;
constexpr double kMatingBandMin = 0.3;
constexpr double kMatingBandMax = 0.7;

bool holds_position(const Soul& soul) {
  switch (soul.state) {
    case SoulState::Preparing:
    case SoulState::Casting:
    case SoulState::AttackingNexus:
    case SoulState::Resting:
    case SoulState::Socialising:
      return true;
    default:
      return false;
  }
}

// Collisions never shove a soul that is committed to a cast or asleep.
bool anchored(const Soul& soul) {
  return soul.is_preparing() || soul.is_casting() || soul.state == SoulState::Resting;
}

}  // namespace

MovementSystem::MovementSystem(const config::Config& cfg, const SpellSystem& spells, Rng& rng)
    : cfg_(cfg),
      spells_(spells),
      rng_(rng),
      soul_grid_(std::max(1.0, cfg.collision_radius * 2.0)) {}

void MovementSystem::update(WorldState& world, double now) {
  for (auto& [id, soul] : world.souls) {
    move_soul(world, soul, now);
  }
  resolve_collisions(world);
}

bool MovementSystem::is_valid_position(const TileMap& tiles, double x, double y, Faction faction) const {
  if (x < cfg_.boundary_buffer || y < cfg_.boundary_buffer || x > cfg_.world_width - cfg_.boundary_buffer ||
      y > cfg_.world_height - cfg_.boundary_buffer) {
    return false;
  }
  auto tile = tiles.tile_at(x, y);
  if (!tile || tiles.owner(*tile) != faction) {
    return false;
  }
  int r = cfg_.territory_check_radius;
  double barrier_sq = cfg_.barrier_distance * cfg_.barrier_distance;
  for (int ty = tile->y - r; ty <= tile->y + r; ++ty) {
    for (int tx = tile->x - r; tx <= tile->x + r; ++tx) {
      if (!tiles.in_bounds(tx, ty) || tiles.owner(tx, ty) == faction) {
        continue;
      }
      auto [cx, cy] = tiles.center({tx, ty});
      if (distance_sq(x, y, cx, cy) < barrier_sq) {
        return false;
      }
    }
  }
  return true;
}

double MovementSystem::speed_of(const WorldState& world, const Soul& soul) const {
  return cfg_.movement_speed * buffs::speed_multiplier(world, soul.faction);
}

void MovementSystem::move_soul(WorldState& world, Soul& soul, double now) {
  if (soul.dead) {
    return;
  }
  if (holds_position(soul)) {
    soul.vx = 0.0;
    soul.vy = 0.0;
    return;
  }
  double speed = speed_of(world, soul);
  if (soul.is_mating()) {
    move_mating(world, soul, speed);
    return;
  }
  auto target = target_for(world, soul, now);
  if (!target) {
    soul.position_history.clear();
    wander(world.tiles, soul, speed);
    return;
  }
  navigate(world.tiles, soul, *target, speed);
}

std::optional<MoveTarget> MovementSystem::target_for(const WorldState& world, const Soul& soul, double now) const {
  switch (soul.state) {
    case SoulState::Defending:
    case SoulState::Attacking:
      return defend_target(world, soul);
    case SoulState::Hungry:
      return nearest_orb(world, soul, now);
    case SoulState::Seeking: {
      if (auto tile = spells_.best_target(world, soul)) {
        auto [cx, cy] = world.tiles.center(*tile);
        return MoveTarget{cx, cy, cfg_.spell_range * kSeekArriveFactor};
      }
      return enemy_nexus(world, soul);
    }
    case SoulState::SeekingNexus:
      return enemy_nexus(world, soul);
    case SoulState::Roaming:
      if (soul.retreating) {
        return retreat_target(world, soul);
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

std::optional<MoveTarget> MovementSystem::defend_target(const WorldState& world, const Soul& soul) const {
  const Soul* enemy = soul.defend_target ? world.find_soul(*soul.defend_target) : nullptr;
  if (!enemy || enemy->dead) {
    return std::nullopt;
  }
  double d = distance(soul.x, soul.y, enemy->x, enemy->y);
  if (d <= cfg_.attack_range) {
    // In reach: hold here.
    return MoveTarget{soul.x, soul.y, 1.0};
  }

  // Walk the segment toward the enemy and stop at the last point that keeps
  // us inside our own territory and clear of the barrier.
  double step = std::min(world.tiles.tile_width(), world.tiles.tile_height());
  int steps = std::max(1, static_cast<int>(std::ceil(d / step)));
  double last_x = soul.x;
  double last_y = soul.y;
  for (int i = 1; i <= steps; ++i) {
    double t = static_cast<double>(i) / steps;
    double px = soul.x + (enemy->x - soul.x) * t;
    double py = soul.y + (enemy->y - soul.y) * t;
    if (!is_valid_position(world.tiles, px, py, soul.faction)) {
      break;
    }
    last_x = px;
    last_y = py;
  }
  double reach = distance(soul.x, soul.y, last_x, last_y);
  if (reach < speed_of(world, soul)) {
    // Already pressed against the border; let navigation slide along it.
    return MoveTarget{enemy->x, enemy->y, cfg_.attack_range};
  }
  return MoveTarget{last_x, last_y, 1.0};
}

std::optional<MoveTarget> MovementSystem::retreat_target(const WorldState& world, const Soul& soul) const {
  double away_x = 0.0;
  double away_y = 0.0;
  bool threatened = false;
  for (const auto& [id, other] : world.souls) {
    if (other.dead || other.faction == soul.faction) {
      continue;
    }
    double d = distance(soul.x, soul.y, other.x, other.y);
    if (d >= cfg_.retreat_distance_threshold) {
      continue;
    }
    auto [ux, uy] = unit_vec(soul.x - other.x, soul.y - other.y);
    double weight = (cfg_.retreat_distance_threshold - d) / cfg_.retreat_distance_threshold;
    away_x += ux * weight;
    away_y += uy * weight;
    threatened = true;
  }
  if (!threatened) {
    return std::nullopt;
  }
  auto [ux, uy] = unit_vec(away_x, away_y);
  return MoveTarget{soul.x + ux * cfg_.retreat_force_distance, soul.y + uy * cfg_.retreat_force_distance,
                    cfg_.movement_speed};
}

std::optional<MoveTarget> MovementSystem::nearest_orb(const WorldState& world, const Soul& soul, double now) const {
  const EnergyOrb* best = nullptr;
  double best_dist = cfg_.search_radius;
  for (const auto& [id, orb] : world.orbs) {
    if (orb.faction != soul.faction || !orb.available(now)) {
      continue;
    }
    double d = distance(soul.x, soul.y, orb.x, orb.y);
    if (d <= best_dist) {
      best_dist = d;
      best = &orb;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  return MoveTarget{best->x, best->y, cfg_.orb_collection_radius * 0.5};
}

std::optional<MoveTarget> MovementSystem::enemy_nexus(const WorldState& world, const Soul& soul) const {
  const Nexus* nexus = world.nexus(opponent(soul.faction));
  if (!nexus || nexus->destroyed) {
    return std::nullopt;
  }
  return MoveTarget{nexus->x, nexus->y, cfg_.attack_range * kSeekArriveFactor};
}

bool MovementSystem::step_to(const TileMap& tiles, Soul& soul, double x, double y) {
  if (!is_valid_position(tiles, x, y, soul.faction)) {
    return false;
  }
  soul.vx = x - soul.x;
  soul.vy = y - soul.y;
  soul.x = x;
  soul.y = y;
  return true;
}

bool MovementSystem::path_blocked(const TileMap& tiles, const Soul& soul, double tx, double ty) const {
  double d = distance(soul.x, soul.y, tx, ty);
  if (d <= 1e-9) {
    return false;
  }
  double lookahead = std::min(d, cfg_.movement_speed * std::max(1, cfg_.path_samples));
  auto [ux, uy] = unit_vec(tx - soul.x, ty - soul.y);
  int samples = std::max(1, cfg_.path_samples);
  for (int i = 1; i <= samples; ++i) {
    double t = lookahead * static_cast<double>(i) / samples;
    if (!is_valid_position(tiles, soul.x + ux * t, soul.y + uy * t, soul.faction)) {
      return true;
    }
  }
  return false;
}

bool MovementSystem::is_stuck(const Soul& soul) const {
  if (static_cast<int>(soul.position_history.size()) < cfg_.position_history_length) {
    return false;
  }
  const auto& first = soul.position_history.front();
  const auto& last = soul.position_history.back();
  return distance(first.first, first.second, last.first, last.second) < cfg_.stuck_distance;
}

int MovementSystem::open_neighbors(const TileMap& tiles, const Soul& soul) const {
  auto tile = tiles.tile_at(soul.x, soul.y);
  if (!tile) {
    return 0;
  }
  static constexpr std::array<std::pair<int, int>, 4> kNeighbors{{{1, 0}, {-1, 0}, {0, 1}, {0, -1}}};
  int open = 0;
  for (const auto& [dx, dy] : kNeighbors) {
    TileCoord next{tile->x + dx, tile->y + dy};
    if (!tiles.in_bounds(next.x, next.y)) {
      continue;
    }
    auto [cx, cy] = tiles.center(next);
    if (is_valid_position(tiles, cx, cy, soul.faction)) {
      ++open;
    }
  }
  return open;
}

void MovementSystem::navigate(const TileMap& tiles, Soul& soul, const MoveTarget& target, double speed) {
  double d = distance(soul.x, soul.y, target.x, target.y);
  if (d <= target.arrive_radius) {
    soul.vx = 0.0;
    soul.vy = 0.0;
    soul.position_history.clear();
    return;
  }

  bool moved = false;
  if (!path_blocked(tiles, soul, target.x, target.y) && !is_stuck(soul)) {
    auto [ux, uy] = unit_vec(target.x - soul.x, target.y - soul.y);
    double step = std::min(speed, d);
    moved = step_to(tiles, soul, soul.x + ux * step, soul.y + uy * step);
  }
  if (!moved && open_neighbors(tiles, soul) <= 2) {
    moved = tunnel_step(tiles, soul, target, speed);
  }
  if (!moved) {
    moved = directional_step(tiles, soul, target, speed);
  }
  if (!moved) {
    moved = escape_step(tiles, soul, speed);
  }
  if (!moved) {
    soul.vx = 0.0;
    soul.vy = 0.0;
  }
  record_position(soul, cfg_);
}

bool MovementSystem::tunnel_step(const TileMap& tiles, Soul& soul, const MoveTarget& target, double speed) {
  double dx = target.x - soul.x;
  double dy = target.y - soul.y;
  std::array<std::pair<double, double>, 2> axes{{{dx > 0.0 ? speed : -speed, 0.0}, {0.0, dy > 0.0 ? speed : -speed}}};
  if (std::abs(dy) > std::abs(dx)) {
    std::swap(axes[0], axes[1]);
  }
  for (const auto& [sx, sy] : axes) {
    if ((sx != 0.0 && std::abs(dx) < 1e-6) || (sy != 0.0 && std::abs(dy) < 1e-6)) {
      continue;
    }
    if (step_to(tiles, soul, soul.x + sx, soul.y + sy)) {
      return true;
    }
  }
  return false;
}

bool MovementSystem::directional_step(const TileMap& tiles, Soul& soul, const MoveTarget& target, double speed) {
  static const double kDiag = std::sqrt(0.5);
  static const std::array<std::pair<double, double>, 8> kDirections{{
      {1.0, 0.0}, {kDiag, kDiag}, {0.0, 1.0}, {-kDiag, kDiag}, {-1.0, 0.0}, {-kDiag, -kDiag}, {0.0, -1.0}, {kDiag, -kDiag},
  }};
  double current = distance(soul.x, soul.y, target.x, target.y);
  double best_progress = 1e-6;
  std::optional<std::pair<double, double>> best;
  for (const auto& [ux, uy] : kDirections) {
    double nx = soul.x + ux * speed;
    double ny = soul.y + uy * speed;
    if (!is_valid_position(tiles, nx, ny, soul.faction)) {
      continue;
    }
    double progress = current - distance(nx, ny, target.x, target.y);
    if (progress > best_progress) {
      best_progress = progress;
      best = std::make_pair(nx, ny);
    }
  }
  return best && step_to(tiles, soul, best->first, best->second);
}

bool MovementSystem::escape_step(const TileMap& tiles, Soul& soul, double speed) {
  for (int ring = 1; ring <= cfg_.escape_rings; ++ring) {
    double radius = speed * 2.0 * ring;
    for (int attempt = 0; attempt < cfg_.escape_attempts_per_ring; ++attempt) {
      double angle = rand_uniform(rng_, 0.0, 2.0 * kPi);
      double ex = soul.x + std::cos(angle) * radius;
      double ey = soul.y + std::sin(angle) * radius;
      if (!is_valid_position(tiles, ex, ey, soul.faction)) {
        continue;
      }
      auto [ux, uy] = unit_vec(ex - soul.x, ey - soul.y);
      if (step_to(tiles, soul, soul.x + ux * speed, soul.y + uy * speed)) {
        soul.position_history.clear();
        return true;
      }
    }
  }
  return false;
}

void MovementSystem::wander(const TileMap& tiles, Soul& soul, double speed) {
  soul.vx += rand_uniform(rng_, -0.5, 0.5) * cfg_.random_movement_force;
  soul.vy += rand_uniform(rng_, -0.5, 0.5) * cfg_.random_movement_force;
  double cap = speed * kWanderSpeedFactor;
  double mag = std::sqrt(soul.vx * soul.vx + soul.vy * soul.vy);
  if (mag > cap && mag > 0.0) {
    soul.vx *= cap / mag;
    soul.vy *= cap / mag;
  }
  double vx = soul.vx;
  double vy = soul.vy;
  if (step_to(tiles, soul, soul.x + vx, soul.y + vy)) {
    return;
  }
  // Bounce off the invalid side.
  if (step_to(tiles, soul, soul.x - vx, soul.y - vy)) {
    return;
  }
  soul.vx = 0.0;
  soul.vy = 0.0;
}

void MovementSystem::move_mating(WorldState& world, Soul& soul, double speed) {
  const Soul* partner = soul.mating_partner ? world.find_soul(*soul.mating_partner) : nullptr;
  if (!partner || partner->dead) {
    soul.vx = 0.0;
    soul.vy = 0.0;
    return;
  }
  double d = distance(soul.x, soul.y, partner->x, partner->y);
  double step = speed * kMatingSpeedFactor;
  auto [ux, uy] = unit_vec(partner->x - soul.x, partner->y - soul.y);
  if (d > cfg_.mating_range * kMatingBandMax) {
    if (!step_to(world.tiles, soul, soul.x + ux * step, soul.y + uy * step)) {
      soul.vx = 0.0;
      soul.vy = 0.0;
    }
  } else if (d < cfg_.mating_range * kMatingBandMin) {
    if (!step_to(world.tiles, soul, soul.x - ux * step, soul.y - uy * step)) {
      soul.vx = 0.0;
      soul.vy = 0.0;
    }
  } else {
    soul.vx = 0.0;
    soul.vy = 0.0;
  }
}

void MovementSystem::resolve_collisions(WorldState& world) {
  soul_grid_.clear();
  for (const auto& [id, soul] : world.souls) {
    if (!soul.dead) {
      soul_grid_.insert(id, soul.x, soul.y);
    }
  }

  double radius = cfg_.collision_radius;
  for (auto& [id, soul] : world.souls) {
    if (soul.dead) {
      continue;
    }
    for (SoulId other_id : soul_grid_.near(soul.x, soul.y, radius)) {
      // Each pair once, from the lower id.
      if (!(id < other_id)) {
        continue;
      }
      Soul* other = world.find_soul(other_id);
      if (!other || other->dead) {
        continue;
      }
      double d = distance(soul.x, soul.y, other->x, other->y);
      if (d >= radius) {
        continue;
      }
      bool soul_fixed = anchored(soul);
      bool other_fixed = anchored(*other);
      if (soul_fixed && other_fixed) {
        continue;
      }
      auto [ux, uy] = unit_vec(other->x - soul.x, other->y - soul.y);
      double push = (radius - d) * cfg_.separation_force;
      double soul_share = soul_fixed ? 0.0 : (other_fixed ? 1.0 : 0.5);
      double other_share = 1.0 - soul_share;
      if (soul_share > 0.0) {
        double nx = soul.x - ux * push * soul_share;
        double ny = soul.y - uy * push * soul_share;
        if (is_valid_position(world.tiles, nx, ny, soul.faction)) {
          soul.x = nx;
          soul.y = ny;
        }
      }
      if (other_share > 0.0) {
        double nx = other->x + ux * push * other_share;
        double ny = other->y + uy * push * other_share;
        if (is_valid_position(world.tiles, nx, ny, other->faction)) {
          other->x = nx;
          other->y = ny;
        }
      }
    }
  }
}

}  // namespace soulwar
