#include "spell.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include "buffs.hpp"

namespace soulwar {

SpellSystem::SpellSystem(const config::Config& cfg, ScoringSystem& scoring) : cfg_(cfg), scoring_(scoring) {}

bool SpellSystem::is_tile_claimed(const WorldState& world, TileCoord tile, SoulId except) const {
  for (const auto& [id, spell] : world.spells) {
    if (spell.target == tile && spell.caster != except) {
      return true;
    }
  }
  for (const auto& [id, soul] : world.souls) {
    if (id == except || soul.dead) {
      continue;
    }
    if (soul.pending_target && *soul.pending_target == tile) {
      return true;
    }
  }
  return false;
}

std::optional<TileCoord> SpellSystem::best_target(const WorldState& world, const Soul& soul) const {
  return scoring_.best_tile(soul.faction,
                            [&](TileCoord tile) { return is_tile_claimed(world, tile, soul.id); });
}

bool SpellSystem::has_capturable(const WorldState& world, const Soul& soul) const {
  return scoring_.has_capturable(soul.faction,
                                 [&](TileCoord tile) { return is_tile_claimed(world, tile, soul.id); });
}

bool SpellSystem::in_range(const WorldState& world, const Soul& soul, TileCoord tile) const {
  auto [cx, cy] = world.tiles.center(tile);
  double d = distance(soul.x, soul.y, cx, cy);
  return d <= cfg_.spell_range && d >= cfg_.spell_min_distance;
}

std::optional<TileCoord> SpellSystem::find_cast_target(const WorldState& world, const Soul& soul, double now) const {
  auto best = best_target(world, soul);
  if (best && in_range(world, soul, *best)) {
    return best;
  }
  if (soul.time_in_state(now) < cfg_.seeking_timeout * cfg_.seeking_fallback_fraction) {
    return std::nullopt;
  }

  const TileMap& tiles = world.tiles;
  int reach_x = static_cast<int>(std::ceil(cfg_.spell_range / tiles.tile_width())) + 1;
  int reach_y = static_cast<int>(std::ceil(cfg_.spell_range / tiles.tile_height())) + 1;
  auto origin = tiles.tile_at(soul.x, soul.y);
  if (!origin) {
    return std::nullopt;
  }
  Faction enemy = opponent(soul.faction);

  std::optional<TileCoord> nearest;
  double nearest_dist = std::numeric_limits<double>::max();
  for (int y = std::max(0, origin->y - reach_y); y <= std::min(tiles.height() - 1, origin->y + reach_y); ++y) {
    for (int x = std::max(0, origin->x - reach_x); x <= std::min(tiles.width() - 1, origin->x + reach_x); ++x) {
      TileCoord tile{x, y};
      if (tiles.owner(tile) != enemy || scoring_.in_nexus_footprint(x, y, enemy)) {
        continue;
      }
      if (!in_range(world, soul, tile) || is_tile_claimed(world, tile, soul.id)) {
        continue;
      }
      auto [cx, cy] = tiles.center(tile);
      double d = distance(soul.x, soul.y, cx, cy);
      if (d < nearest_dist) {
        nearest_dist = d;
        nearest = tile;
      }
    }
  }
  return nearest;
}

double SpellSystem::cast_duration(const WorldState& world, Faction faction) const {
  return cfg_.spell_cast_time * buffs::cast_time_multiplier(world, faction);
}

void SpellSystem::update(WorldState& world, double now, EventList& events) {
  for (auto& [id, soul] : world.souls) {
    if (soul.dead || !soul.is_casting() || world.spell_by_caster(id)) {
      continue;
    }
    std::optional<TileCoord> target = soul.pending_target;
    // Recheck before commit: another cast may have claimed or captured the
    // tile since this soul picked it.
    bool stale = !target || world.tiles.owner(*target) == soul.faction;
    if (!stale) {
      for (const auto& [spell_id, spell] : world.spells) {
        if (spell.target == *target) {
          stale = true;
          break;
        }
      }
    }
    if (stale) {
      soul.transition_to(SoulState::Roaming, now);
      continue;
    }

    ActiveSpell spell;
    spell.id = world.next_spell_id();
    spell.caster = id;
    spell.faction = soul.faction;
    spell.target = *target;
    spell.started_at = soul.state_started_at;
    spell.completes_at = spell.started_at + cast_duration(world, soul.faction);
    spell.caster_x = soul.x;
    spell.caster_y = soul.y;
    auto [tx, ty] = world.tiles.center(*target);
    spell.target_x = tx;
    spell.target_y = ty;

    soul.remove_energy(cfg_.casting_energy_cost * soul.max_energy);
    events.emplace_back(event::SpellStarted{spell});
    world.spells.emplace(spell.id, spell);
  }
}

void SpellSystem::complete_due(WorldState& world, double now, EventList& events) {
  std::vector<ActiveSpell> due;
  for (const auto& [id, spell] : world.spells) {
    if (spell.completes_at <= now) {
      due.push_back(spell);
    }
  }
  for (const ActiveSpell& spell : due) {
    complete(world, spell, now, events);
  }
}

void SpellSystem::complete(WorldState& world, const ActiveSpell& spell, double now, EventList& events) {
  world.spells.erase(spell.id);
  Soul* caster = world.find_soul(spell.caster);
  if (!caster || caster->dead) {
    events.emplace_back(event::SpellInterrupted{spell.id, spell.caster, spell.target});
    return;
  }

  std::vector<TileCoord> changed = world.tiles.capture(spell.target, cfg_.capture_radius, spell.faction);
  scoring_.recompute();

  caster->transition_to(SoulState::Roaming, now);
  caster->dead = true;
  stand_down_defenders(world, spell.caster, now);

  events.emplace_back(event::SpellCompleted{spell.id, spell.caster, spell.target, spell.faction});
  for (const TileCoord& tile : changed) {
    events.emplace_back(event::TileUpdated{tile, spell.faction});
  }
  buffs::apply(world, BuffSource::Spell, spell.faction, "conquest",
               BuffEffects{cfg_.conquest_speed_multiplier, 1.0, 1.0, 1.0}, now, cfg_.conquest_duration, events);

  spdlog::debug("{} soul {} captured tile ({}, {}), {} tiles changed", faction_name(spell.faction),
                spell.caster.value, spell.target.x, spell.target.y, changed.size());
}

bool SpellSystem::interrupt(WorldState& world, SoulId caster, double now, EventList& events) {
  Soul* soul = world.find_soul(caster);
  if (!soul) {
    return false;
  }
  bool interrupted = false;
  for (auto it = world.spells.begin(); it != world.spells.end(); ++it) {
    if (it->second.caster == caster) {
      events.emplace_back(event::SpellInterrupted{it->first, caster, it->second.target});
      spdlog::debug("spell {} of soul {} interrupted", it->first.value, caster.value);
      world.spells.erase(it);
      interrupted = true;
      break;
    }
  }
  if (soul->is_preparing() || soul->is_casting()) {
    soul->transition_to(SoulState::Roaming, now);
    interrupted = true;
  }
  soul->pending_target.reset();
  if (interrupted) {
    stand_down_defenders(world, caster, now);
  }
  return interrupted;
}

void SpellSystem::handle_death(WorldState& world, SoulId soul, double now, EventList& events) {
  interrupt(world, soul, now, events);
}

void SpellSystem::stand_down_defenders(WorldState& world, SoulId caster, double now) {
  for (auto& [id, soul] : world.souls) {
    if (soul.defend_target && *soul.defend_target == caster) {
      soul.transition_to(SoulState::Roaming, now);
    }
  }
}

}  // namespace soulwar
