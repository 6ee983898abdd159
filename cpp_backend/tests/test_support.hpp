#pragma once

#include <algorithm>
#include <utility>
#include <variant>

#include "clock.hpp"
#include "config.hpp"
#include "events.hpp"
#include "world.hpp"

namespace soulwar::testing {

// Seeded, empty world: no initial souls or orbs, no energy drain, no
// disasters and no emergency respawn. Any number of adults may seek.
inline config::Config quiet_config() {
  config::Config cfg;
  cfg.random_seed = 7;
  cfg.souls_per_team = 0;
  cfg.orbs_per_team = 0;
  cfg.energy_drain_chance = 0.0;
  cfg.disasters_enabled = false;
  cfg.emergency_respawn = false;
  cfg.min_resting_souls = 0;
  return cfg;
}

template <typename T>
int count_events(const EventList& events) {
  return static_cast<int>(std::count_if(events.begin(), events.end(), [](const Event& ev) {
    return std::holds_alternative<T>(ev);
  }));
}

template <typename T>
const T* first_event(const EventList& events) {
  for (const Event& ev : events) {
    if (const T* found = std::get_if<T>(&ev)) {
      return found;
    }
  }
  return nullptr;
}

struct WorldFixture {
  explicit WorldFixture(config::Config c = quiet_config()) : cfg(std::move(c)), clock(0.0), world(cfg, clock) {}

  // Moves the clock to `t` and runs one tick.
  const EventList& tick_at(double t) {
    clock.set(t);
    events = world.update();
    return events;
  }

  Soul& adult(Faction faction, double x, double y, double energy = 100.0) {
    Soul& soul = world.spawn_soul(faction, x, y);
    soul.energy = energy;
    return soul;
  }

  config::Config cfg;
  ManualClock clock;
  GameWorld world;
  EventList events;
};

}  // namespace soulwar::testing
