#include "disaster.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

#include "buffs.hpp"

namespace soulwar {
namespace {

constexpr double kNexusClearance = 100.0;
constexpr double kMeteoriteEntryHeight = 200.0;
constexpr double kCraterMinSize = 30.0;
constexpr double kCraterMaxSize = 60.0;

std::vector<Soul*> living(WorldState& world) {
  std::vector<Soul*> out;
  for (auto& [id, soul] : world.souls) {
    if (!soul.dead) {
      out.push_back(&soul);
    }
  }
  return out;
}

int mark_dead(const std::vector<Soul*>& victims, int count) {
  int killed = 0;
  for (Soul* soul : victims) {
    if (killed >= count) {
      break;
    }
    soul->dead = true;
    ++killed;
  }
  return killed;
}

int living_count(const WorldState& world) {
  int count = 0;
  for (const auto& [id, soul] : world.souls) {
    if (!soul.dead) {
      ++count;
    }
  }
  return count;
}

}  // namespace

DisasterSystem::DisasterSystem(const config::Config& cfg, Rng& rng, double start_time)
    : cfg_(cfg),
      rng_(rng),
      last_check_at_(start_time) {}

const config::DisasterSettings& DisasterSystem::settings(DisasterKind kind) const {
  return kind == DisasterKind::FreezingSnow ? cfg_.freezing_snow : cfg_.meteorite_storm;
}

void DisasterSystem::update(WorldState& world, double now, EventList& events) {
  if (active_) {
    if (now - active_->started_at >= active_->duration) {
      end(world, events);
      return;
    }
    if (active_->kind == DisasterKind::FreezingSnow) {
      apply_freezing_snow(world, now);
    } else {
      apply_meteorites(world, now, events);
    }
    return;
  }

  if (!cfg_.disasters_enabled || now - last_check_at_ < cfg_.disaster_check_interval) {
    return;
  }
  last_check_at_ = now;
  for (DisasterKind kind : {DisasterKind::FreezingSnow, DisasterKind::MeteoriteStorm}) {
    const auto& s = settings(kind);
    if (!s.enabled) {
      continue;
    }
    auto last = last_triggered_at_.find(kind);
    if (last != last_triggered_at_.end() && now - last->second < s.cooldown) {
      continue;
    }
    if (rand_chance(rng_, s.trigger_chance)) {
      trigger(world, kind, now, events);
      return;
    }
  }
}

bool DisasterSystem::trigger(WorldState& world, DisasterKind kind, double now, EventList& events) {
  if (active_) {
    return false;
  }
  const auto& s = settings(kind);
  ActiveDisaster disaster;
  disaster.kind = kind;
  disaster.started_at = now;
  disaster.duration = s.duration;
  disaster.kill_target = static_cast<int>(std::floor(living_count(world) * s.death_fraction));
  disaster.last_kill_at = now;
  if (kind == DisasterKind::MeteoriteStorm) {
    disaster.meteorites = plan_meteorites(world, s.waves, s.duration);
  }
  last_triggered_at_[kind] = now;

  if (s.speed_multiplier != 1.0) {
    for (Faction faction : kFactions) {
      buffs::apply(world, BuffSource::Disaster, faction, disaster_name(kind),
                   BuffEffects{s.speed_multiplier, 1.0, 1.0, 1.0}, now, std::nullopt, events);
    }
  }

  events.emplace_back(event::DisasterStarted{kind, disaster.duration, disaster.meteorites});
  spdlog::info("{} started, {} souls will perish", disaster_name(kind), disaster.kill_target);
  active_ = std::move(disaster);
  return true;
}

void DisasterSystem::end(WorldState& world, EventList& events) {
  ActiveDisaster& disaster = *active_;
  if (disaster.kind == DisasterKind::MeteoriteStorm) {
    apply_meteorites(world, disaster.started_at + disaster.duration, events);
  }
  if (disaster.killed < disaster.kill_target) {
    disaster.killed += kill_random(world, disaster.kill_target - disaster.killed);
  }
  buffs::clear_source(world, BuffSource::Disaster, events);
  events.emplace_back(event::DisasterEnded{disaster.kind, disaster.killed});
  spdlog::info("{} ended after {} deaths", disaster_name(disaster.kind), disaster.killed);
  active_.reset();
}

void DisasterSystem::apply_freezing_snow(WorldState& world, double now) {
  ActiveDisaster& disaster = *active_;
  if (now - disaster.last_kill_at < settings(disaster.kind).kill_interval) {
    return;
  }
  int due = static_cast<int>(std::floor(disaster.kill_target * disaster.progress(now))) - disaster.killed;
  if (due <= 0) {
    return;
  }
  disaster.killed += kill_random(world, due);
  disaster.last_kill_at = now;
}

void DisasterSystem::apply_meteorites(WorldState& world, double now, EventList& events) {
  ActiveDisaster& disaster = *active_;
  int waves = static_cast<int>(disaster.meteorites.size());
  int landed = 0;
  for (Meteorite& meteorite : disaster.meteorites) {
    if (meteorite.landed) {
      ++landed;
      continue;
    }
    if (disaster.started_at + meteorite.impact_offset > now) {
      continue;
    }
    meteorite.landed = true;
    ++landed;

    Crater crater;
    crater.x = meteorite.target_x;
    crater.y = meteorite.target_y;
    crater.size = rand_uniform(rng_, kCraterMinSize, kCraterMaxSize);
    crater.created_at = now;
    craters_.push_back(crater);
    events.emplace_back(event::MeteoriteImpact{meteorite.id, crater});

    int due = waves > 0 ? static_cast<int>(std::floor(disaster.kill_target * static_cast<double>(landed) / waves)) -
                              disaster.killed
                        : 0;
    if (due > 0) {
      disaster.killed += kill_nearest(world, crater.x, crater.y, due);
      disaster.last_kill_at = now;
    }
  }
}

std::vector<Meteorite> DisasterSystem::plan_meteorites(const WorldState& world, int waves, double duration) {
  std::vector<Meteorite> out;
  for (int i = 0; i < waves; ++i) {
    Meteorite meteorite;
    meteorite.id = i + 1;
    meteorite.impact_offset = duration * static_cast<double>(i + 1) / static_cast<double>(waves + 1);
    // Land away from both nexuses; give up on clearance after a few tries.
    for (int attempt = 0; attempt < 20; ++attempt) {
      meteorite.target_x = rand_uniform(rng_, cfg_.boundary_buffer, cfg_.world_width - cfg_.boundary_buffer);
      meteorite.target_y = rand_uniform(rng_, cfg_.boundary_buffer, cfg_.world_height - cfg_.boundary_buffer);
      bool clear = true;
      for (const auto& [faction, nexus] : world.nexuses) {
        if (distance(meteorite.target_x, meteorite.target_y, nexus.x, nexus.y) < kNexusClearance) {
          clear = false;
          break;
        }
      }
      if (clear) {
        break;
      }
    }
    meteorite.start_x = meteorite.target_x + rand_uniform(rng_, -kMeteoriteEntryHeight, kMeteoriteEntryHeight);
    meteorite.start_y = meteorite.target_y - kMeteoriteEntryHeight;
    out.push_back(meteorite);
  }
  return out;
}

int DisasterSystem::kill_random(WorldState& world, int count) {
  std::vector<Soul*> alive = living(world);
  std::shuffle(alive.begin(), alive.end(), rng_);
  return mark_dead(alive, count);
}

int DisasterSystem::kill_nearest(WorldState& world, double x, double y, int count) {
  std::vector<Soul*> alive = living(world);
  // Closest to the impact first; ties keep ascending id order.
  std::stable_sort(alive.begin(), alive.end(), [&](const Soul* a, const Soul* b) {
    return distance_sq(a->x, a->y, x, y) < distance_sq(b->x, b->y, x, y);
  });
  return mark_dead(alive, count);
}

}  // namespace soulwar
