#include "world.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>

#include "buffs.hpp"
#include "soul.hpp"

namespace soulwar {
namespace {

constexpr int kSpawnAttempts = 20;

Rng::result_type seed_of(const config::Config& cfg) {
  return cfg.random_seed ? static_cast<Rng::result_type>(*cfg.random_seed) : std::random_device{}();
}

}  // namespace

GameWorld::GameWorld(const config::Config& cfg, const Clock& clock)
    : cfg_(cfg),
      clock_(clock),
      rng_(seed_of(cfg)),
      state_(TileMap::split(cfg)),
      scoring_(cfg, state_.tiles),
      spells_(cfg, scoring_),
      combat_(cfg, spells_, rng_),
      movement_(cfg, spells_, rng_),
      mating_(cfg, rng_),
      day_night_(cfg, clock.now()),
      machine_(cfg, spells_, day_night_),
      disasters_(cfg, rng_, clock.now()) {
  double now = clock_.now();
  init_nexuses(now);
  spawn_initial(now);
  day_night_.update(state_, now, pending_);
}

void GameWorld::init_nexuses(double now) {
  for (Faction faction : kFactions) {
    Nexus nexus;
    nexus.faction = faction;
    nexus.tile = scoring_.nexus_tile(faction);
    auto [x, y] = state_.tiles.center(nexus.tile);
    nexus.x = x;
    nexus.y = y;
    nexus.health = cfg_.nexus_max_health;
    nexus.max_health = cfg_.nexus_max_health;
    nexus.last_regen_at = now;
    state_.nexuses[faction] = nexus;
  }
}

void GameWorld::spawn_initial(double now) {
  for (int i = 0; i < cfg_.souls_per_team; ++i) {
    for (Faction faction : kFactions) {
      auto [x, y] = nexus_spawn_position(faction);
      add_soul(faction, x, y, false, now, pending_);
    }
  }
  for (int i = 0; i < cfg_.orbs_per_team; ++i) {
    for (Faction faction : kFactions) {
      auto [x, y] = orb_spawn_position(faction);
      add_orb(faction, x, y, pending_);
    }
  }
}

Soul& GameWorld::spawn_soul(Faction faction, double x, double y, bool child) {
  return add_soul(faction, x, y, child, clock_.now(), pending_);
}

EnergyOrb& GameWorld::spawn_orb(Faction faction, double x, double y) {
  return add_orb(faction, x, y, pending_);
}

Soul& GameWorld::add_soul(Faction faction, double x, double y, bool child, double now, EventList& events) {
  SoulId id = state_.next_soul_id();
  auto it = state_.souls.emplace(id, make_soul(id, faction, x, y, now, child, cfg_, rng_)).first;
  events.emplace_back(event::SoulSpawned{view_of(it->second, now, cfg_)});
  return it->second;
}

EnergyOrb& GameWorld::add_orb(Faction faction, double x, double y, EventList& events) {
  EnergyOrb orb;
  orb.id = state_.next_orb_id();
  orb.faction = faction;
  orb.x = x;
  orb.y = y;
  orb.energy = cfg_.orb_energy;
  auto it = state_.orbs.emplace(orb.id, orb).first;
  events.emplace_back(event::OrbSpawned{it->second});
  return it->second;
}

std::pair<double, double> GameWorld::nexus_spawn_position(Faction faction) {
  const Nexus* nexus = state_.nexus(faction);
  double cx = nexus ? nexus->x : cfg_.world_width * 0.5;
  double cy = nexus ? nexus->y : cfg_.world_height * 0.5;
  double half = cfg_.nexus_spawn_offset * 0.5;
  for (int attempt = 0; attempt < kSpawnAttempts; ++attempt) {
    double x = cx + rand_uniform(rng_, -half, half);
    double y = cy + rand_uniform(rng_, -half, half);
    if (movement_.is_valid_position(state_.tiles, x, y, faction)) {
      return {x, y};
    }
  }
  return {cx, cy};
}

// Random own tile at least spawn_safe_distance tiles from the map edge and
// from every enemy tile, jittered around its center.
std::pair<double, double> GameWorld::orb_spawn_position(Faction faction) {
  const TileMap& tiles = state_.tiles;
  int safe = cfg_.spawn_safe_distance;
  std::vector<TileCoord> candidates;
  for (int y = safe; y < tiles.height() - safe; ++y) {
    for (int x = safe; x < tiles.width() - safe; ++x) {
      if (tiles.owner(x, y) != faction) {
        continue;
      }
      bool clear = true;
      for (int cy = y - safe; cy <= y + safe && clear; ++cy) {
        for (int cx = x - safe; cx <= x + safe && clear; ++cx) {
          clear = tiles.owner(cx, cy) == faction;
        }
      }
      if (clear) {
        candidates.push_back({x, y});
      }
    }
  }
  if (candidates.empty()) {
    return {cfg_.world_width * 0.5, cfg_.world_height * 0.5};
  }
  int pick = rand_int(rng_, 0, static_cast<int>(candidates.size()) - 1);
  const TileCoord& tile = candidates[static_cast<std::size_t>(pick)];
  auto [x, y] = tiles.center(tile);
  x += rand_uniform(rng_, -0.5, 0.5) * cfg_.orb_spawn_offset_x;
  y += rand_uniform(rng_, -0.5, 0.5) * cfg_.orb_spawn_offset_y;
  return {x, y};
}

EventList GameWorld::update() {
  double now = clock_.now();
  ++tick_;

  EventList events;
  events.swap(pending_);

  update_souls(now, events);
  handle_deaths(now, events);
  movement_.update(state_, now);
  spells_.update(state_, now, events);
  combat_.update(state_, now, events);
  spells_.complete_due(state_, now, events);
  mating_.update(state_, now, events);
  collect_orbs(now, events);
  respawn_orbs(now, events);
  regenerate_nexuses(now, events);
  emergency_respawn(now, events);
  disasters_.update(state_, now, events);
  day_night_.update(state_, now, events);
  buffs::expire(state_, now, events);

  for (const auto& [id, soul] : state_.souls) {
    events.emplace_back(event::SoulUpdated{view_of(soul, now, cfg_)});
  }
  return events;
}

void GameWorld::update_souls(double now, EventList& events) {
  for (auto& [id, soul] : state_.souls) {
    update_vitals(soul, now, cfg_, rng_);
    machine_.update(state_, soul, now, events);
  }
}

void GameWorld::handle_deaths(double now, EventList& events) {
  std::vector<SoulId> expired;
  for (auto& [id, soul] : state_.souls) {
    if (!soul.dead) {
      continue;
    }
    if (!soul.death_started) {
      soul.death_started = true;
      soul.death_started_at = now;
      spells_.handle_death(state_, id, now, events);
      if (soul.mating_partner) {
        cancel_mating(state_, soul, now, events);
      }
      for (auto& [other_id, other] : state_.souls) {
        if (other.defend_target && *other.defend_target == id) {
          other.transition_to(SoulState::Roaming, now);
        }
      }
      events.emplace_back(event::SoulDeath{view_of(soul, now, cfg_)});
    } else if (now - soul.death_started_at >= cfg_.death_grace_period) {
      expired.push_back(id);
    }
  }
  for (SoulId id : expired) {
    Faction faction = state_.souls.at(id).faction;
    state_.souls.erase(id);
    events.emplace_back(event::SoulRemoved{id, faction});
  }
}

void GameWorld::collect_orbs(double now, EventList& events) {
  for (auto& [id, soul] : state_.souls) {
    if (soul.dead || soul.energy_fraction() >= cfg_.hungry_threshold) {
      continue;
    }
    for (auto& [orb_id, orb] : state_.orbs) {
      if (orb.faction != soul.faction || !orb.available(now)) {
        continue;
      }
      if (distance(soul.x, soul.y, orb.x, orb.y) >= cfg_.orb_collection_radius) {
        continue;
      }
      double gained = orb.energy * buffs::energy_multiplier(state_, soul.faction);
      soul.add_energy(gained);
      orb.respawn_at = now + rand_uniform(rng_, cfg_.orb_respawn_min, cfg_.orb_respawn_max);
      events.emplace_back(event::OrbCollected{orb_id, id, gained, orb.respawn_at});
    }
  }
}

void GameWorld::respawn_orbs(double now, EventList& events) {
  for (auto& [id, orb] : state_.orbs) {
    if (orb.respawn_at <= 0.0 || orb.respawn_at > now) {
      continue;
    }
    auto [x, y] = orb_spawn_position(orb.faction);
    orb.x = x;
    orb.y = y;
    orb.respawn_at = 0.0;
    events.emplace_back(event::OrbSpawned{orb});
  }
}

void GameWorld::regenerate_nexuses(double now, EventList& events) {
  for (auto& [faction, nexus] : state_.nexuses) {
    if (nexus.destroyed || now - nexus.last_regen_at < cfg_.nexus_regen_interval) {
      continue;
    }
    nexus.last_regen_at = now;
    if (nexus.health >= nexus.max_health) {
      continue;
    }
    nexus.health = std::min(nexus.max_health, nexus.health + cfg_.nexus_regen_amount);
    events.emplace_back(event::NexusUpdate{nexus});
  }
}

void GameWorld::emergency_respawn(double now, EventList& events) {
  if (!cfg_.emergency_respawn || state_.souls.empty()) {
    return;
  }
  for (Faction faction : kFactions) {
    if (state_.adult_count(faction, now, cfg_.child_maturity_time) > 0) {
      continue;
    }
    auto [x, y] = nexus_spawn_position(faction);
    Soul& soul = add_soul(faction, x, y, false, now, events);
    events.emplace_back(event::EmergencyRespawn{faction, soul.id});
    spdlog::info("{} faction has no adults left, emergency respawn of soul {}", faction_name(faction),
                 soul.id.value);
  }
}

WorldSnapshot GameWorld::snapshot() const {
  double now = clock_.now();
  WorldSnapshot snap;
  snap.time = now;
  snap.tick = tick_;
  snap.world_width = cfg_.world_width;
  snap.world_height = cfg_.world_height;
  snap.tiles_x = state_.tiles.width();
  snap.tiles_y = state_.tiles.height();
  snap.tile_width = state_.tiles.tile_width();
  snap.tile_height = state_.tiles.tile_height();
  snap.tiles = state_.tiles.owners();

  snap.souls.reserve(state_.souls.size());
  for (const auto& [id, soul] : state_.souls) {
    snap.souls.push_back(view_of(soul, now, cfg_));
  }
  for (const auto& [id, orb] : state_.orbs) {
    snap.orbs.push_back(orb);
  }
  for (const auto& [faction, nexus] : state_.nexuses) {
    snap.nexuses.push_back(nexus);
  }
  for (const auto& [id, spell] : state_.spells) {
    snap.spells.push_back(spell);
  }
  for (const auto& [id, buff] : state_.buffs) {
    snap.buffs.push_back(buff);
  }
  snap.day_night = day_night_.info(now);
  snap.disaster = disasters_.active();
  snap.craters = disasters_.craters();
  return snap;
}

}  // namespace soulwar
