#include "mating.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <map>
#include <set>
#include <vector>

#include "soul.hpp"

namespace soulwar {

bool can_mate(const Soul& soul, double now, const config::Config& cfg) {
  if (soul.dead || soul.mating_partner || !soul.is_adult(now, cfg.child_maturity_time)) {
    return false;
  }
  if (soul.energy_fraction() < cfg.min_energy_for_mating) {
    return false;
  }
  return now - soul.last_mating_at >= cfg.mating_cooldown;
}

void begin_mating(Soul& first, Soul& second, double now, EventList& events) {
  for (Soul* soul : {&first, &second}) {
    soul->transition_to(SoulState::Mating, now);
    soul->mating_started_at = now;
    soul->ready_to_complete_mating = false;
  }
  first.mating_partner = second.id;
  second.mating_partner = first.id;
  events.emplace_back(
      event::MatingStarted{first.id, second.id, (first.x + second.x) * 0.5, (first.y + second.y) * 0.5});
}

void cancel_mating(WorldState& world, Soul& soul, double now, EventList& events) {
  std::optional<SoulId> partner_id = soul.mating_partner;
  soul.mating_partner.reset();
  soul.mating_started_at.reset();
  soul.ready_to_complete_mating = false;
  if (soul.is_mating()) {
    soul.transition_to(SoulState::Roaming, now);
  }
  if (!partner_id) {
    return;
  }
  events.emplace_back(event::MatingCancelled{soul.id, *partner_id});
  Soul* partner = world.find_soul(*partner_id);
  if (!partner || !partner->mating_partner || *partner->mating_partner != soul.id) {
    return;
  }
  partner->mating_partner.reset();
  partner->mating_started_at.reset();
  partner->ready_to_complete_mating = false;
  if (partner->is_mating()) {
    partner->transition_to(SoulState::Roaming, now);
  }
}

MatingSystem::MatingSystem(const config::Config& cfg, Rng& rng) : cfg_(cfg), rng_(rng) {}

void MatingSystem::update(WorldState& world, double now, EventList& events) {
  process_child_maturation(world, now, events);
  if (!last_pairing_at_ || now - *last_pairing_at_ >= cfg_.mating_check_interval) {
    last_pairing_at_ = now;
    pair_souls(world, now, events);
  }
  process_completed(world, now, events);
}

void MatingSystem::process_child_maturation(WorldState& world, double now, EventList& events) {
  for (auto& [id, soul] : world.souls) {
    if (soul.dead || !soul.child || !soul.is_adult(now, cfg_.child_maturity_time)) {
      continue;
    }
    soul.child = false;
    events.emplace_back(event::SoulMatured{view_of(soul, now, cfg_)});
  }
}

int MatingSystem::pair_souls(WorldState& world, double now, EventList& events) {
  int started = 0;
  for (Faction faction : kFactions) {
    // Each running pair will add one soul, so it counts against the cap now.
    int expected = world.population(faction);
    for (const auto& [id, soul] : world.souls) {
      if (soul.faction == faction && !soul.dead && soul.mating_partner && id < *soul.mating_partner) {
        ++expected;
      }
    }

    std::vector<Soul*> candidates;
    for (auto& [id, soul] : world.souls) {
      if (soul.faction == faction && soul.state == SoulState::Roaming && can_mate(soul, now, cfg_)) {
        candidates.push_back(&soul);
      }
    }

    for (std::size_t i = 0; i < candidates.size() && expected < cfg_.max_souls_per_team; ++i) {
      Soul* first = candidates[i];
      if (first->mating_partner) {
        continue;
      }
      Soul* closest = nullptr;
      double closest_dist = std::numeric_limits<double>::max();
      for (std::size_t j = i + 1; j < candidates.size(); ++j) {
        Soul* other = candidates[j];
        if (other->mating_partner) {
          continue;
        }
        double d = distance(first->x, first->y, other->x, other->y);
        if (d <= cfg_.mating_range && d < closest_dist) {
          closest_dist = d;
          closest = other;
        }
      }
      if (!closest) {
        continue;
      }
      begin_mating(*first, *closest, now, events);
      ++expected;
      ++started;
    }
  }
  return started;
}

int MatingSystem::process_completed(WorldState& world, double now, EventList& events) {
  std::set<PairKey> seen;
  std::vector<std::pair<SoulId, SoulId>> ready;
  for (const auto& [id, soul] : world.souls) {
    if (soul.dead || !soul.is_mating() || !soul.ready_to_complete_mating || !soul.mating_partner) {
      continue;
    }
    const Soul* partner = world.find_soul(*soul.mating_partner);
    if (!partner || partner->dead || !partner->ready_to_complete_mating) {
      continue;
    }
    if (!seen.insert(key_of(id, partner->id)).second) {
      continue;
    }
    ready.emplace_back(id, partner->id);
  }

  int children = 0;
  for (const auto& [first_id, second_id] : ready) {
    Soul* first = world.find_soul(first_id);
    Soul* second = world.find_soul(second_id);
    if (!first || !second) {
      continue;
    }
    Faction faction = first->faction;
    double mid_x = (first->x + second->x) * 0.5;
    double mid_y = (first->y + second->y) * 0.5;

    for (Soul* parent : {first, second}) {
      parent->mating_partner.reset();
      parent->mating_started_at.reset();
      parent->ready_to_complete_mating = false;
      parent->last_mating_at = now;
      parent->transition_to(SoulState::Roaming, now);
    }

    if (world.population(faction) >= cfg_.max_souls_per_team) {
      spdlog::debug("{} population cap reached, pair {}/{} produced no child", faction_name(faction),
                    first_id.value, second_id.value);
      continue;
    }
    Soul child = make_soul(world.next_soul_id(), faction, mid_x, mid_y, now, true, cfg_, rng_);
    SoulView view = view_of(child, now, cfg_);
    world.souls.emplace(child.id, std::move(child));
    events.emplace_back(event::MatingCompleted{first_id, second_id, view});
    events.emplace_back(event::SoulSpawned{view});
    ++children;
  }
  return children;
}

}  // namespace soulwar
