#pragma once

#include <optional>

#include "config.hpp"
#include "events.hpp"
#include "spell.hpp"
#include "world_state.hpp"

namespace soulwar {

class CombatSystem {
 public:
  CombatSystem(const config::Config& cfg, SpellSystem& spells, Rng& rng);

  void update(WorldState& world, double now, EventList& events);

  bool can_attack(const Soul& soul, double now) const;

  void attack(WorldState& world, Soul& attacker, Soul& target, double now, EventList& events);
  void attack_nexus(WorldState& world, Soul& attacker, Nexus& nexus, double now, EventList& events);

  // The soul that should intercept `enemy`: none when someone already
  // defends against it, otherwise the highest-energy eligible soul of the
  // other faction (lowest id on ties).
  static std::optional<SoulId> select_defender(const WorldState& world, const Soul& enemy, double now,
                                               const config::Config& cfg);

  static bool is_defended(const WorldState& world, SoulId enemy, SoulId except = SoulId{});

 private:
  const config::Config& cfg_;
  SpellSystem& spells_;
  Rng& rng_;
};

}  // namespace soulwar
