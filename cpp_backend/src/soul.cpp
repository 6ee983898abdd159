#include "soul.hpp"

namespace soulwar {

const char* state_name(SoulState state) {
  switch (state) {
    case SoulState::Roaming:
      return "ROAMING";
    case SoulState::Hungry:
      return "HUNGRY";
    case SoulState::Seeking:
      return "SEEKING";
    case SoulState::Preparing:
      return "PREPARING";
    case SoulState::Casting:
      return "CASTING";
    case SoulState::Defending:
      return "DEFENDING";
    case SoulState::Attacking:
      return "ATTACKING";
    case SoulState::SeekingNexus:
      return "SEEKING_NEXUS";
    case SoulState::AttackingNexus:
      return "ATTACKING_NEXUS";
    case SoulState::Socialising:
      return "SOCIALISING";
    case SoulState::Resting:
      return "RESTING";
    case SoulState::Mating:
      return "MATING";
  }
  return "UNKNOWN";
}

void Soul::transition_to(SoulState next, double now) {
  if (next == state) {
    return;
  }
  previous_state = state;
  state = next;
  state_started_at = now;

  if (next != SoulState::Defending && next != SoulState::Attacking) {
    defend_target.reset();
  }
  if (next != SoulState::Preparing && next != SoulState::Casting) {
    pending_target.reset();
  }
  if (next != SoulState::Resting) {
    sleeping = false;
  }
  if (next == SoulState::Casting) {
    last_cast_at = now;
  }
  position_history.clear();
}

Soul make_soul(SoulId id, Faction faction, double x, double y, double now, bool child, const config::Config& cfg,
               Rng& rng) {
  Soul soul;
  soul.id = id;
  soul.faction = faction;
  soul.x = x;
  soul.y = y;
  soul.max_energy = cfg.max_energy;
  soul.energy = child ? cfg.starting_energy_min
                      : rand_uniform(rng, cfg.starting_energy_min, cfg.starting_energy_max);
  soul.child = child;
  soul.born_at = now;
  soul.state_started_at = now;
  return soul;
}

void update_vitals(Soul& soul, double now, const config::Config& cfg, Rng& rng) {
  if (soul.dead) {
    return;
  }
  if (!soul.sleeping && rand_chance(rng, cfg.energy_drain_chance)) {
    soul.remove_energy(cfg.energy_drain_amount);
  }
  if (soul.retreating && now - soul.last_attacked_at >= cfg.retreat_duration) {
    soul.retreating = false;
  }
  if (soul.energy <= 0.0) {
    soul.dead = true;
  }
}

void record_position(Soul& soul, const config::Config& cfg) {
  soul.position_history.emplace_back(soul.x, soul.y);
  while (static_cast<int>(soul.position_history.size()) > cfg.position_history_length) {
    soul.position_history.pop_front();
  }
}

}  // namespace soulwar
