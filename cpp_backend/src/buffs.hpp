#pragma once

#include <optional>
#include <string>

#include "events.hpp"
#include "world_state.hpp"

namespace soulwar::buffs {

BuffId apply(WorldState& world, BuffSource source, Faction faction, std::string name, BuffEffects effects,
             double now, std::optional<double> duration, EventList& events);

void remove(WorldState& world, BuffId id, EventList& events);

void clear_source(WorldState& world, BuffSource source, EventList& events);

void expire(WorldState& world, double now, EventList& events);

// Effective multipliers are the product over all of a faction's buffs.
double speed_multiplier(const WorldState& world, Faction faction);
double cast_time_multiplier(const WorldState& world, Faction faction);
double energy_multiplier(const WorldState& world, Faction faction);
double damage_multiplier(const WorldState& world, Faction faction);

}  // namespace soulwar::buffs
