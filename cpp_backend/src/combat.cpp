#include "combat.hpp"

#include <spdlog/spdlog.h>

#include "buffs.hpp"

namespace soulwar {
namespace {

bool eligible_defender(const Soul& soul, double now, const config::Config& cfg) {
  if (soul.dead || !soul.is_adult(now, cfg.child_maturity_time)) {
    return false;
  }
  return soul.state == SoulState::Roaming || soul.state == SoulState::Hungry || soul.state == SoulState::Seeking;
}

}  // namespace

CombatSystem::CombatSystem(const config::Config& cfg, SpellSystem& spells, Rng& rng)
    : cfg_(cfg),
      spells_(spells),
      rng_(rng) {}

bool CombatSystem::is_defended(const WorldState& world, SoulId enemy, SoulId except) {
  for (const auto& [id, soul] : world.souls) {
    if (id == except || soul.dead || !soul.is_defending()) {
      continue;
    }
    if (soul.defend_target && *soul.defend_target == enemy) {
      return true;
    }
  }
  return false;
}

std::optional<SoulId> CombatSystem::select_defender(const WorldState& world, const Soul& enemy, double now,
                                                    const config::Config& cfg) {
  if (enemy.dead || !(enemy.is_casting() || enemy.is_preparing())) {
    return std::nullopt;
  }
  if (is_defended(world, enemy.id)) {
    return std::nullopt;
  }
  const Soul* best = nullptr;
  for (const auto& [id, soul] : world.souls) {
    if (soul.faction == enemy.faction || !eligible_defender(soul, now, cfg)) {
      continue;
    }
    if (!best || soul.energy > best->energy) {
      best = &soul;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  return best->id;
}

bool CombatSystem::can_attack(const Soul& soul, double now) const {
  if (soul.dead || soul.retreating || !soul.is_adult(now, cfg_.child_maturity_time)) {
    return false;
  }
  return now - soul.last_attack_at >= cfg_.attack_cooldown;
}

void CombatSystem::update(WorldState& world, double now, EventList& events) {
  for (auto& [id, soul] : world.souls) {
    if (soul.dead) {
      continue;
    }
    if (soul.is_defending() && soul.defend_target) {
      Soul* target = world.find_soul(*soul.defend_target);
      if (!target || target->dead) {
        continue;
      }
      if (distance(soul.x, soul.y, target->x, target->y) <= cfg_.attack_range && can_attack(soul, now)) {
        attack(world, soul, *target, now, events);
      }
      continue;
    }
    if (soul.state == SoulState::AttackingNexus) {
      Nexus* nexus = world.nexus(opponent(soul.faction));
      if (!nexus || nexus->destroyed) {
        continue;
      }
      if (distance(soul.x, soul.y, nexus->x, nexus->y) <= cfg_.attack_range && can_attack(soul, now)) {
        attack_nexus(world, soul, *nexus, now, events);
      }
    }
  }
}

void CombatSystem::attack(WorldState& world, Soul& attacker, Soul& target, double now, EventList& events) {
  double damage = rand_uniform(rng_, cfg_.attack_damage_min, cfg_.attack_damage_max) *
                  buffs::damage_multiplier(world, attacker.faction);
  attacker.last_attack_at = now;
  target.remove_energy(damage);
  target.last_attacked_at = now;
  target.retreating = true;
  if (target.state == SoulState::Resting) {
    target.transition_to(SoulState::Roaming, now);
  }

  events.emplace_back(event::Attack{attacker.id, target.id, damage, attacker.x, attacker.y, target.x, target.y});

  // Any hit breaks concentration, whatever the target was doing. This also
  // stands the attacker down once the cast is gone.
  spells_.interrupt(world, target.id, now, events);
}

void CombatSystem::attack_nexus(WorldState& world, Soul& attacker, Nexus& nexus, double now, EventList& events) {
  double damage = rand_uniform(rng_, cfg_.attack_damage_min, cfg_.attack_damage_max) *
                  buffs::damage_multiplier(world, attacker.faction);
  attacker.last_attack_at = now;
  bool destroyed = nexus.take_damage(damage);

  events.emplace_back(event::NexusAttack{attacker.id, nexus.faction, damage, attacker.x, attacker.y});
  events.emplace_back(event::NexusUpdate{nexus});
  if (destroyed) {
    events.emplace_back(event::NexusDestroyed{nexus.faction, attacker.id});
    spdlog::info("{} nexus destroyed by soul {}", faction_name(nexus.faction), attacker.id.value);
  }
}

}  // namespace soulwar
