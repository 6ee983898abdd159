#pragma once

#include <cstdint>
#include <optional>
#include <utility>

#include "config.hpp"
#include "events.hpp"
#include "world_state.hpp"

namespace soulwar {

bool can_mate(const Soul& soul, double now, const config::Config& cfg);

// Pairs two souls and puts both into Mating.
void begin_mating(Soul& first, Soul& second, double now, EventList& events);

// Breaks up the soul's pair, sending both partners back to Roaming.
void cancel_mating(WorldState& world, Soul& soul, double now, EventList& events);

class MatingSystem {
 public:
  MatingSystem(const config::Config& cfg, Rng& rng);

  void update(WorldState& world, double now, EventList& events);

  void process_child_maturation(WorldState& world, double now, EventList& events);

  // Throttled to one run per mating_check_interval. Returns pairs started.
  int pair_souls(WorldState& world, double now, EventList& events);

  // Spawns offspring for pairs whose mating time has elapsed. Each unordered
  // pair is processed once; both parents leave Mating in the same pass, so
  // nothing about the pair outlives the call. Returns children spawned.
  int process_completed(WorldState& world, double now, EventList& events);

 private:
  using PairKey = std::pair<std::uint32_t, std::uint32_t>;

  static PairKey key_of(SoulId a, SoulId b) {
    return a.value < b.value ? PairKey{a.value, b.value} : PairKey{b.value, a.value};
  }

  const config::Config& cfg_;
  Rng& rng_;
  std::optional<double> last_pairing_at_;
};

}  // namespace soulwar
