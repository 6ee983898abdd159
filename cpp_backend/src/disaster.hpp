#pragma once

#include <map>
#include <optional>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "world_state.hpp"

namespace soulwar {

struct ActiveDisaster {
  DisasterKind kind = DisasterKind::FreezingSnow;
  double started_at = 0.0;
  double duration = 0.0;
  int kill_target = 0;
  int killed = 0;
  double last_kill_at = 0.0;
  std::vector<Meteorite> meteorites;

  double progress(double now) const {
    return duration > 0.0 ? clamp((now - started_at) / duration, 0.0, 1.0) : 1.0;
  }
};

// Rolls for a global hazard every check interval. Only one disaster runs at
// a time; each kind has its own cooldown. A disaster kills its share of the
// population gradually and finishes the remainder when it ends.
class DisasterSystem {
 public:
  DisasterSystem(const config::Config& cfg, Rng& rng, double start_time);

  void update(WorldState& world, double now, EventList& events);

  // Starts `kind` immediately, ignoring chance and cooldown. Returns false if
  // another disaster is already active.
  bool trigger(WorldState& world, DisasterKind kind, double now, EventList& events);

  const std::optional<ActiveDisaster>& active() const {
    return active_;
  }

  const std::vector<Crater>& craters() const {
    return craters_;
  }

 private:
  const config::DisasterSettings& settings(DisasterKind kind) const;
  void end(WorldState& world, EventList& events);
  void apply_freezing_snow(WorldState& world, double now);
  void apply_meteorites(WorldState& world, double now, EventList& events);
  std::vector<Meteorite> plan_meteorites(const WorldState& world, int waves, double duration);
  int kill_random(WorldState& world, int count);
  int kill_nearest(WorldState& world, double x, double y, int count);

  const config::Config& cfg_;
  Rng& rng_;
  double last_check_at_;
  std::map<DisasterKind, double> last_triggered_at_;
  std::optional<ActiveDisaster> active_;
  std::vector<Crater> craters_;
};

}  // namespace soulwar
