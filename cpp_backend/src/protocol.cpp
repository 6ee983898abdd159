#include "protocol.hpp"

namespace soulwar::protocol {
namespace json = boost::json;
namespace {

json::value optional_id(const std::optional<SoulId>& id) {
  if (!id) {
    return nullptr;
  }
  return id->value;
}

json::object tile_json(TileCoord tile) {
  json::object out;
  out["x"] = tile.x;
  out["y"] = tile.y;
  return out;
}

json::object meteorite_json(const Meteorite& meteorite) {
  json::object out;
  out["id"] = meteorite.id;
  out["startX"] = round_to(meteorite.start_x, 2);
  out["startY"] = round_to(meteorite.start_y, 2);
  out["targetX"] = round_to(meteorite.target_x, 2);
  out["targetY"] = round_to(meteorite.target_y, 2);
  out["impactOffset"] = round_to(meteorite.impact_offset, 3);
  out["landed"] = meteorite.landed;
  return out;
}

json::object crater_json(const Crater& crater) {
  json::object out;
  out["x"] = round_to(crater.x, 2);
  out["y"] = round_to(crater.y, 2);
  out["size"] = round_to(crater.size, 2);
  out["createdAt"] = round_to(crater.created_at, 3);
  return out;
}

json::object disaster_json(const ActiveDisaster& disaster) {
  json::object out;
  out["type"] = disaster_name(disaster.kind);
  out["startedAt"] = round_to(disaster.started_at, 3);
  out["duration"] = disaster.duration;
  out["killTarget"] = disaster.kill_target;
  out["killed"] = disaster.killed;
  json::array meteorites;
  for (const Meteorite& meteorite : disaster.meteorites) {
    meteorites.push_back(meteorite_json(meteorite));
  }
  out["meteorites"] = std::move(meteorites);
  return out;
}

json::object phase_json(const PhaseInfo& info) {
  json::object out;
  out["phase"] = day_phase_name(info.phase);
  out["phaseProgress"] = round_to(info.phase_progress, 3);
  out["cycleProgress"] = round_to(info.cycle_progress, 3);
  out["cycle"] = info.cycle;
  out["ambientLight"] = round_to(info.ambient_light, 3);
  return out;
}

struct EventData {
  json::object operator()(const event::SoulSpawned& ev) const {
    return {{"soul", soul_json(ev.soul)}};
  }
  json::object operator()(const event::SoulUpdated& ev) const {
    return {{"soul", soul_json(ev.soul)}};
  }
  json::object operator()(const event::SoulDeath& ev) const {
    return {{"soul", soul_json(ev.soul)}};
  }
  json::object operator()(const event::SoulRemoved& ev) const {
    return {{"soulId", ev.soul.value}, {"team", faction_name(ev.faction)}};
  }
  json::object operator()(const event::SoulMatured& ev) const {
    return {{"soul", soul_json(ev.soul)}};
  }
  json::object operator()(const event::Attack& ev) const {
    json::object out;
    out["attackerId"] = ev.attacker.value;
    out["targetId"] = ev.target.value;
    out["damage"] = round_to(ev.damage, 2);
    out["attackerX"] = round_to(ev.attacker_x, 2);
    out["attackerY"] = round_to(ev.attacker_y, 2);
    out["targetX"] = round_to(ev.target_x, 2);
    out["targetY"] = round_to(ev.target_y, 2);
    return out;
  }
  json::object operator()(const event::SpellStarted& ev) const {
    return {{"spell", spell_json(ev.spell)}};
  }
  json::object operator()(const event::SpellInterrupted& ev) const {
    return {{"spellId", ev.spell.value}, {"casterId", ev.caster.value}, {"target", tile_json(ev.target)}};
  }
  json::object operator()(const event::SpellCompleted& ev) const {
    return {{"spellId", ev.spell.value},
            {"casterId", ev.caster.value},
            {"target", tile_json(ev.target)},
            {"team", faction_name(ev.faction)}};
  }
  json::object operator()(const event::TileUpdated& ev) const {
    return {{"x", ev.tile.x}, {"y", ev.tile.y}, {"team", faction_name(ev.owner)}};
  }
  json::object operator()(const event::OrbSpawned& ev) const {
    return {{"orb", orb_json(ev.orb)}};
  }
  json::object operator()(const event::OrbCollected& ev) const {
    return {{"orbId", ev.orb.value},
            {"collectorId", ev.collector.value},
            {"energyGained", round_to(ev.energy_gained, 2)},
            {"respawnAt", round_to(ev.respawn_at, 3)}};
  }
  json::object operator()(const event::MatingStarted& ev) const {
    return {{"firstId", ev.first.value},
            {"secondId", ev.second.value},
            {"x", round_to(ev.x, 2)},
            {"y", round_to(ev.y, 2)}};
  }
  json::object operator()(const event::MatingCompleted& ev) const {
    return {{"firstId", ev.first.value}, {"secondId", ev.second.value}, {"child", soul_json(ev.child)}};
  }
  json::object operator()(const event::MatingCancelled& ev) const {
    return {{"firstId", ev.first.value}, {"secondId", ev.second.value}};
  }
  json::object operator()(const event::DisasterStarted& ev) const {
    json::array meteorites;
    for (const Meteorite& meteorite : ev.meteorites) {
      meteorites.push_back(meteorite_json(meteorite));
    }
    return {{"type", disaster_name(ev.kind)}, {"duration", ev.duration}, {"meteorites", std::move(meteorites)}};
  }
  json::object operator()(const event::DisasterEnded& ev) const {
    return {{"type", disaster_name(ev.kind)}, {"killed", ev.killed}};
  }
  json::object operator()(const event::MeteoriteImpact& ev) const {
    return {{"meteoriteId", ev.meteorite}, {"crater", crater_json(ev.crater)}};
  }
  json::object operator()(const event::NexusAttack& ev) const {
    return {{"attackerId", ev.attacker.value},
            {"team", faction_name(ev.nexus)},
            {"damage", round_to(ev.damage, 2)},
            {"attackerX", round_to(ev.attacker_x, 2)},
            {"attackerY", round_to(ev.attacker_y, 2)}};
  }
  json::object operator()(const event::NexusUpdate& ev) const {
    return {{"nexus", nexus_json(ev.nexus)}};
  }
  json::object operator()(const event::NexusDestroyed& ev) const {
    return {{"team", faction_name(ev.nexus)}, {"destroyedBy", ev.destroyed_by.value}};
  }
  json::object operator()(const event::BuffApplied& ev) const {
    return {{"buff", buff_json(ev.buff)}};
  }
  json::object operator()(const event::BuffRemoved& ev) const {
    return {{"buffId", ev.buff.value}, {"team", faction_name(ev.faction)}, {"source", buff_source_name(ev.source)}};
  }
  json::object operator()(const event::DayNightPhaseChange& ev) const {
    return {{"phase", day_phase_name(ev.phase)},
            {"previousPhase", day_phase_name(ev.previous)},
            {"cycleProgress", round_to(ev.cycle_progress, 3)}};
  }
  json::object operator()(const event::EmergencyRespawn& ev) const {
    return {{"team", faction_name(ev.faction)}, {"soulId", ev.soul.value}};
  }
};

}  // namespace

json::object soul_json(const SoulView& soul) {
  json::object out;
  out["id"] = soul.id.value;
  out["team"] = faction_name(soul.faction);
  out["x"] = round_to(soul.x, 2);
  out["y"] = round_to(soul.y, 2);
  out["energy"] = round_to(soul.energy, 2);
  out["maxEnergy"] = soul.max_energy;
  out["state"] = state_name(soul.state);
  out["isCasting"] = soul.casting;
  out["isPreparing"] = soul.preparing;
  out["isDefending"] = soul.defending;
  out["isRetreating"] = soul.retreating;
  out["isChild"] = soul.child;
  out["maturity"] = round_to(soul.maturity, 3);
  out["isMating"] = soul.mating;
  out["matingPartner"] = optional_id(soul.mating_partner);
  out["isSleeping"] = soul.sleeping;
  out["sleepProgress"] = round_to(soul.sleep_progress, 3);
  out["isDead"] = soul.dead;
  return out;
}

json::object orb_json(const EnergyOrb& orb) {
  json::object out;
  out["id"] = orb.id.value;
  out["team"] = faction_name(orb.faction);
  out["x"] = round_to(orb.x, 2);
  out["y"] = round_to(orb.y, 2);
  out["energy"] = orb.energy;
  out["respawnAt"] = round_to(orb.respawn_at, 3);
  return out;
}

json::object nexus_json(const Nexus& nexus) {
  json::object out;
  out["team"] = faction_name(nexus.faction);
  out["tileX"] = nexus.tile.x;
  out["tileY"] = nexus.tile.y;
  out["x"] = round_to(nexus.x, 2);
  out["y"] = round_to(nexus.y, 2);
  out["health"] = round_to(nexus.health, 2);
  out["maxHealth"] = nexus.max_health;
  out["destroyed"] = nexus.destroyed;
  return out;
}

json::object spell_json(const ActiveSpell& spell) {
  json::object out;
  out["id"] = spell.id.value;
  out["casterId"] = spell.caster.value;
  out["team"] = faction_name(spell.faction);
  out["target"] = tile_json(spell.target);
  out["startedAt"] = round_to(spell.started_at, 3);
  out["completesAt"] = round_to(spell.completes_at, 3);
  out["duration"] = round_to(spell.duration(), 3);
  out["casterX"] = round_to(spell.caster_x, 2);
  out["casterY"] = round_to(spell.caster_y, 2);
  out["targetX"] = round_to(spell.target_x, 2);
  out["targetY"] = round_to(spell.target_y, 2);
  return out;
}

json::object buff_json(const Buff& buff) {
  json::object effects;
  effects["speed"] = buff.effects.speed;
  effects["castTime"] = buff.effects.cast_time;
  effects["energy"] = buff.effects.energy;
  effects["damage"] = buff.effects.damage;

  json::object out;
  out["id"] = buff.id.value;
  out["source"] = buff_source_name(buff.source);
  out["name"] = buff.name;
  out["team"] = faction_name(buff.faction);
  out["effects"] = std::move(effects);
  out["appliedAt"] = round_to(buff.applied_at, 3);
  if (buff.expires_at) {
    out["expiresAt"] = round_to(*buff.expires_at, 3);
  } else {
    out["expiresAt"] = nullptr;
  }
  return out;
}

json::object event_data(const Event& ev) {
  return std::visit(EventData{}, ev);
}

json::object event_message(const Event& ev) {
  json::object out;
  out["type"] = event_type(ev);
  out["data"] = event_data(ev);
  return out;
}

json::object world_state(const WorldSnapshot& snap) {
  json::object world;
  world["width"] = snap.world_width;
  world["height"] = snap.world_height;

  // Owners as a string of row-major 'L'/'D' cells.
  std::string cells;
  cells.reserve(snap.tiles.size());
  for (Faction owner : snap.tiles) {
    cells.push_back(owner == Faction::Light ? 'L' : 'D');
  }
  json::object tiles;
  tiles["width"] = snap.tiles_x;
  tiles["height"] = snap.tiles_y;
  tiles["tileWidth"] = snap.tile_width;
  tiles["tileHeight"] = snap.tile_height;
  tiles["owners"] = cells;

  json::array souls;
  for (const SoulView& soul : snap.souls) {
    souls.push_back(soul_json(soul));
  }
  json::array orbs;
  for (const EnergyOrb& orb : snap.orbs) {
    orbs.push_back(orb_json(orb));
  }
  json::array nexuses;
  for (const Nexus& nexus : snap.nexuses) {
    nexuses.push_back(nexus_json(nexus));
  }
  json::array spells;
  for (const ActiveSpell& spell : snap.spells) {
    spells.push_back(spell_json(spell));
  }
  json::array buffs;
  for (const Buff& buff : snap.buffs) {
    buffs.push_back(buff_json(buff));
  }
  json::array craters;
  for (const Crater& crater : snap.craters) {
    craters.push_back(crater_json(crater));
  }

  json::object out;
  out["time"] = round_to(snap.time, 3);
  out["tick"] = snap.tick;
  out["world"] = std::move(world);
  out["tiles"] = std::move(tiles);
  out["souls"] = std::move(souls);
  out["orbs"] = std::move(orbs);
  out["nexuses"] = std::move(nexuses);
  out["spells"] = std::move(spells);
  out["buffs"] = std::move(buffs);
  out["dayNight"] = phase_json(snap.day_night);
  if (snap.disaster) {
    out["disaster"] = disaster_json(*snap.disaster);
  } else {
    out["disaster"] = nullptr;
  }
  out["craters"] = std::move(craters);
  return out;
}

json::object world_state_message(const WorldSnapshot& snap) {
  json::object out;
  out["type"] = "world_state";
  out["data"] = world_state(snap);
  return out;
}

json::object status(const WorldSnapshot& snap) {
  int light = 0;
  int dark = 0;
  for (const SoulView& soul : snap.souls) {
    if (soul.dead) {
      continue;
    }
    (soul.faction == Faction::Light ? light : dark) += 1;
  }
  int light_tiles = 0;
  for (Faction owner : snap.tiles) {
    if (owner == Faction::Light) {
      ++light_tiles;
    }
  }

  json::object population;
  population["light"] = light;
  population["dark"] = dark;
  json::object tiles;
  tiles["light"] = light_tiles;
  tiles["dark"] = static_cast<int>(snap.tiles.size()) - light_tiles;

  json::object out;
  out["tick"] = snap.tick;
  out["time"] = round_to(snap.time, 3);
  out["population"] = std::move(population);
  out["tiles"] = std::move(tiles);
  out["phase"] = day_phase_name(snap.day_night.phase);
  if (snap.disaster) {
    out["disaster"] = disaster_name(snap.disaster->kind);
  } else {
    out["disaster"] = nullptr;
  }
  return out;
}

std::string message_type(const std::string& text) {
  boost::system::error_code ec;
  json::value value = json::parse(text, ec);
  if (ec || !value.is_object()) {
    return {};
  }
  const json::object& payload = value.as_object();
  auto type_it = payload.find("type");
  if (type_it == payload.end() || !type_it->value().is_string()) {
    return {};
  }
  return std::string(type_it->value().as_string().c_str());
}

}  // namespace soulwar::protocol
