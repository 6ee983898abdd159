#include "state_machine.hpp"

#include <algorithm>
#include <limits>

#include "combat.hpp"
#include "mating.hpp"

namespace soulwar {

SoulStateMachine::SoulStateMachine(const config::Config& cfg, const SpellSystem& spells,
                                   const DayNightSystem& day_night)
    : cfg_(cfg),
      spells_(spells),
      day_night_(day_night) {}

int SoulStateMachine::offensive_count(const WorldState& world, Faction faction) {
  int count = 0;
  for (const auto& [id, soul] : world.souls) {
    if (soul.dead || soul.faction != faction) {
      continue;
    }
    switch (soul.state) {
      case SoulState::Seeking:
      case SoulState::Preparing:
      case SoulState::Casting:
      case SoulState::SeekingNexus:
      case SoulState::AttackingNexus:
        ++count;
        break;
      default:
        break;
    }
  }
  return count;
}

int SoulStateMachine::seek_allowance(const WorldState& world, Faction faction, double now) const {
  int adults = world.adult_count(faction, now, cfg_.child_maturity_time);
  return std::max(0, adults - cfg_.min_resting_souls) - offensive_count(world, faction);
}

bool SoulStateMachine::can_seek(const WorldState& world, const Soul& soul, double now) const {
  if (!soul.is_adult(now, cfg_.child_maturity_time)) {
    return false;
  }
  if (now - soul.last_cast_at < cfg_.spell_cooldown) {
    return false;
  }
  if (soul.energy < cfg_.min_energy_to_cast) {
    return false;
  }
  return seek_allowance(world, soul.faction, now) > 0;
}

bool SoulStateMachine::should_sleep(const Soul& soul, double now) const {
  if (soul.dead || soul.retreating || !soul.is_adult(now, cfg_.child_maturity_time)) {
    return false;
  }
  if (!day_night_.is_unfavored(soul.faction, now)) {
    return false;
  }
  if (soul.last_sleep_cycle == day_night_.cycle_index(now)) {
    return false;
  }
  double fraction = soul.energy_fraction();
  return fraction >= cfg_.sleep_min_energy && fraction <= cfg_.sleep_max_energy;
}

bool SoulStateMachine::enemy_nexus_alive(const WorldState& world, const Soul& soul) const {
  const Nexus* nexus = world.nexus(opponent(soul.faction));
  return nexus && !nexus->destroyed;
}

bool SoulStateMachine::try_defend(WorldState& world, Soul& soul, double now) {
  for (const auto& [id, enemy] : world.souls) {
    if (enemy.faction == soul.faction || enemy.dead || !(enemy.is_casting() || enemy.is_preparing())) {
      continue;
    }
    auto chosen = CombatSystem::select_defender(world, enemy, now, cfg_);
    if (chosen && *chosen == soul.id) {
      soul.transition_to(SoulState::Defending, now);
      soul.defend_target = id;
      return true;
    }
  }
  return false;
}

void SoulStateMachine::update(WorldState& world, Soul& soul, double now, EventList& events) {
  if (soul.dead) {
    return;
  }
  switch (soul.state) {
    case SoulState::Roaming:
      on_roaming(world, soul, now);
      break;
    case SoulState::Hungry:
      on_hungry(world, soul, now);
      break;
    case SoulState::Seeking:
      on_seeking(world, soul, now);
      break;
    case SoulState::Preparing:
      on_preparing(world, soul, now);
      break;
    case SoulState::Casting:
      on_casting(world, soul, now);
      break;
    case SoulState::Defending:
      on_defending(world, soul, now);
      break;
    case SoulState::Attacking:
      on_attacking(world, soul, now);
      break;
    case SoulState::SeekingNexus:
      on_seeking_nexus(world, soul, now);
      break;
    case SoulState::AttackingNexus:
      on_attacking_nexus(world, soul, now);
      break;
    case SoulState::Socialising:
      soul.transition_to(is_hungry(soul) ? SoulState::Hungry : SoulState::Roaming, now);
      break;
    case SoulState::Resting:
      on_resting(soul, now);
      break;
    case SoulState::Mating:
      on_mating(world, soul, now, events);
      break;
  }
}

void SoulStateMachine::on_roaming(WorldState& world, Soul& soul, double now) {
  if (is_hungry(soul)) {
    soul.transition_to(SoulState::Hungry, now);
    return;
  }
  if (try_defend(world, soul, now)) {
    return;
  }
  if (should_sleep(soul, now)) {
    soul.transition_to(SoulState::Resting, now);
    soul.sleeping = true;
    soul.sleep_started_at = now;
    soul.last_sleep_cycle = day_night_.cycle_index(now);
    soul.vx = 0.0;
    soul.vy = 0.0;
    return;
  }
  if (!can_seek(world, soul, now)) {
    return;
  }
  if (spells_.has_capturable(world, soul)) {
    soul.transition_to(SoulState::Seeking, now);
  } else if (enemy_nexus_alive(world, soul)) {
    soul.transition_to(SoulState::SeekingNexus, now);
  }
}

void SoulStateMachine::on_hungry(WorldState& world, Soul& soul, double now) {
  if (try_defend(world, soul, now)) {
    return;
  }
  if (!is_hungry(soul)) {
    soul.transition_to(SoulState::Roaming, now);
  }
}

void SoulStateMachine::on_seeking(WorldState& world, Soul& soul, double now) {
  if (is_hungry(soul)) {
    soul.transition_to(SoulState::Hungry, now);
    return;
  }
  if (world.adult_count(soul.faction, now, cfg_.child_maturity_time) <= cfg_.min_resting_souls) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (try_defend(world, soul, now)) {
    return;
  }
  if (auto target = spells_.find_cast_target(world, soul, now)) {
    soul.transition_to(SoulState::Preparing, now);
    soul.pending_target = *target;
    soul.vx = 0.0;
    soul.vy = 0.0;
    return;
  }
  if (!spells_.has_capturable(world, soul)) {
    soul.transition_to(enemy_nexus_alive(world, soul) ? SoulState::SeekingNexus : SoulState::Roaming, now);
    return;
  }
  if (soul.time_in_state(now) >= cfg_.seeking_timeout) {
    soul.transition_to(SoulState::Roaming, now);
  }
}

void SoulStateMachine::on_preparing(WorldState& world, Soul& soul, double now) {
  if (!soul.pending_target || world.tiles.owner(*soul.pending_target) == soul.faction) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (soul.time_in_state(now) >= cfg_.spell_preparation_time) {
    soul.transition_to(SoulState::Casting, now);
  }
}

// A running spell is ended only by the spell system, after combat has had
// its chance to interrupt it.
void SoulStateMachine::on_casting(WorldState& world, Soul& soul, double now) {
  if (world.spell_by_caster(soul.id)) {
    return;
  }
  if (soul.time_in_state(now) >= cfg_.state_timeout) {
    soul.transition_to(SoulState::Roaming, now);
  }
}

void SoulStateMachine::on_defending(WorldState& world, Soul& soul, double now) {
  const Soul* enemy = soul.defend_target ? world.find_soul(*soul.defend_target) : nullptr;
  if (!enemy || enemy->dead || !(enemy->is_casting() || enemy->is_preparing())) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (soul.time_in_state(now) >= cfg_.state_timeout) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (distance(soul.x, soul.y, enemy->x, enemy->y) <= cfg_.attack_range) {
    soul.transition_to(SoulState::Attacking, now);
  }
}

void SoulStateMachine::on_attacking(WorldState& world, Soul& soul, double now) {
  const Soul* enemy = soul.defend_target ? world.find_soul(*soul.defend_target) : nullptr;
  if (!enemy || enemy->dead || !(enemy->is_casting() || enemy->is_preparing())) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (soul.time_in_state(now) >= cfg_.state_timeout) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (distance(soul.x, soul.y, enemy->x, enemy->y) > cfg_.attack_range) {
    soul.transition_to(SoulState::Defending, now);
  }
}

void SoulStateMachine::on_seeking_nexus(WorldState& world, Soul& soul, double now) {
  if (is_hungry(soul)) {
    soul.transition_to(SoulState::Hungry, now);
    return;
  }
  if (!enemy_nexus_alive(world, soul)) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (world.adult_count(soul.faction, now, cfg_.child_maturity_time) <= cfg_.min_resting_souls) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (spells_.has_capturable(world, soul)) {
    soul.transition_to(SoulState::Seeking, now);
    return;
  }
  const Nexus* nexus = world.nexus(opponent(soul.faction));
  if (distance(soul.x, soul.y, nexus->x, nexus->y) <= cfg_.attack_range) {
    soul.transition_to(SoulState::AttackingNexus, now);
    return;
  }
  if (soul.time_in_state(now) >= cfg_.seeking_timeout) {
    soul.transition_to(SoulState::Roaming, now);
  }
}

void SoulStateMachine::on_attacking_nexus(WorldState& world, Soul& soul, double now) {
  if (is_hungry(soul)) {
    soul.transition_to(SoulState::Hungry, now);
    return;
  }
  if (!enemy_nexus_alive(world, soul)) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (world.adult_count(soul.faction, now, cfg_.child_maturity_time) <= cfg_.min_resting_souls) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (spells_.has_capturable(world, soul)) {
    soul.transition_to(SoulState::Seeking, now);
    return;
  }
  const Nexus* nexus = world.nexus(opponent(soul.faction));
  if (distance(soul.x, soul.y, nexus->x, nexus->y) > cfg_.attack_range) {
    soul.transition_to(SoulState::SeekingNexus, now);
  }
}

void SoulStateMachine::on_resting(Soul& soul, double now) {
  if (!soul.sleeping || soul.last_attacked_at >= soul.sleep_started_at) {
    soul.transition_to(SoulState::Roaming, now);
    return;
  }
  if (soul.sleep_progress(now, cfg_.sleep_duration) >= 1.0) {
    soul.add_energy(cfg_.sleep_energy_recovery);
    soul.transition_to(SoulState::Roaming, now);
  }
}

void SoulStateMachine::on_mating(WorldState& world, Soul& soul, double now, EventList& events) {
  if (!soul.mating_partner) {
    // Look for the closest eligible, unpaired partner nearby.
    Soul* closest = nullptr;
    double closest_dist = std::numeric_limits<double>::max();
    for (auto& [id, other] : world.souls) {
      if (id == soul.id || other.faction != soul.faction || other.state != SoulState::Roaming ||
          !can_mate(other, now, cfg_)) {
        continue;
      }
      double d = distance(soul.x, soul.y, other.x, other.y);
      if (d <= cfg_.mating_range && d < closest_dist) {
        closest_dist = d;
        closest = &other;
      }
    }
    if (closest) {
      begin_mating(soul, *closest, now, events);
    } else if (soul.time_in_state(now) >= cfg_.state_timeout) {
      soul.transition_to(SoulState::Roaming, now);
    }
    return;
  }

  Soul* partner = world.find_soul(*soul.mating_partner);
  if (!partner || partner->dead || !partner->mating_partner || *partner->mating_partner != soul.id) {
    cancel_mating(world, soul, now, events);
    return;
  }
  if (distance(soul.x, soul.y, partner->x, partner->y) > cfg_.mating_range) {
    cancel_mating(world, soul, now, events);
    return;
  }
  if (soul.mating_started_at && now - *soul.mating_started_at >= cfg_.mating_time) {
    soul.ready_to_complete_mating = true;
  }
}

}  // namespace soulwar
