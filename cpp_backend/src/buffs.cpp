#include "buffs.hpp"

#include <vector>

namespace soulwar::buffs {
namespace {

template <typename Pick>
double product(const WorldState& world, Faction faction, Pick pick) {
  double value = 1.0;
  for (const auto& [id, buff] : world.buffs) {
    if (buff.faction == faction) {
      value *= pick(buff.effects);
    }
  }
  return value;
}

template <typename Pred>
void remove_if(WorldState& world, Pred pred, EventList& events) {
  for (auto it = world.buffs.begin(); it != world.buffs.end();) {
    if (!pred(it->second)) {
      ++it;
      continue;
    }
    events.emplace_back(event::BuffRemoved{it->first, it->second.faction, it->second.source});
    it = world.buffs.erase(it);
  }
}

}  // namespace

BuffId apply(WorldState& world, BuffSource source, Faction faction, std::string name, BuffEffects effects,
             double now, std::optional<double> duration, EventList& events) {
  // A named buff from one source replaces its earlier instance rather than stacking.
  remove_if(
      world,
      [&](const Buff& buff) { return buff.source == source && buff.faction == faction && buff.name == name; },
      events);

  Buff buff;
  buff.id = world.next_buff_id();
  buff.source = source;
  buff.name = std::move(name);
  buff.faction = faction;
  buff.effects = effects;
  buff.applied_at = now;
  if (duration) {
    buff.expires_at = now + *duration;
  }
  BuffId id = buff.id;
  events.emplace_back(event::BuffApplied{buff});
  world.buffs.emplace(id, std::move(buff));
  return id;
}

void remove(WorldState& world, BuffId id, EventList& events) {
  remove_if(world, [&](const Buff& buff) { return buff.id == id; }, events);
}

void clear_source(WorldState& world, BuffSource source, EventList& events) {
  remove_if(world, [&](const Buff& buff) { return buff.source == source; }, events);
}

void expire(WorldState& world, double now, EventList& events) {
  remove_if(world, [&](const Buff& buff) { return buff.expires_at && *buff.expires_at <= now; }, events);
}

double speed_multiplier(const WorldState& world, Faction faction) {
  return product(world, faction, [](const BuffEffects& e) { return e.speed; });
}

double cast_time_multiplier(const WorldState& world, Faction faction) {
  return product(world, faction, [](const BuffEffects& e) { return e.cast_time; });
}

double energy_multiplier(const WorldState& world, Faction faction) {
  return product(world, faction, [](const BuffEffects& e) { return e.energy; });
}

double damage_multiplier(const WorldState& world, Faction faction) {
  return product(world, faction, [](const BuffEffects& e) { return e.damage; });
}

}  // namespace soulwar::buffs
