#pragma once

#include <optional>

#include "config.hpp"
#include "events.hpp"
#include "world_state.hpp"

namespace soulwar {

struct PhaseInfo {
  DayPhase phase = DayPhase::Day;
  // Progress through the current phase, 0..1.
  double phase_progress = 0.0;
  // Progress through the whole cycle, 0..1.
  double cycle_progress = 0.0;
  long cycle = 0;
  double ambient_light = 1.0;
};

// Day favors light and night favors dark. The favored faction gets a
// day/night buff for the duration of its phase; dusk and dawn are neutral.
class DayNightSystem {
 public:
  DayNightSystem(const config::Config& cfg, double start_time);

  PhaseInfo info(double now) const;

  DayPhase phase(double now) const {
    return info(now).phase;
  }

  long cycle_index(double now) const {
    return info(now).cycle;
  }

  bool is_favored(Faction faction, double now) const;
  bool is_unfavored(Faction faction, double now) const;

  // Applies phase buffs on a phase change and emits the change event.
  void update(WorldState& world, double now, EventList& events);

  std::optional<DayPhase> current() const {
    return current_;
  }

 private:
  const config::Config& cfg_;
  double start_time_;
  std::optional<DayPhase> current_;
};

}  // namespace soulwar
