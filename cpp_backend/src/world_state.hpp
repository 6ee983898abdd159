#pragma once

#include <map>
#include <vector>

#include "config.hpp"
#include "models.hpp"
#include "tile_map.hpp"

namespace soulwar {

using SoulMap = std::map<SoulId, Soul>;
using OrbMap = std::map<OrbId, EnergyOrb>;
using SpellMap = std::map<SpellId, ActiveSpell>;
using BuffMap = std::map<BuffId, Buff>;

// Authoritative collections for one world. Ordered maps keep every scan in
// ascending id order, which is the tie-break for all agent-level choices.
struct WorldState {
  explicit WorldState(TileMap map) : tiles(std::move(map)) {}

  TileMap tiles;
  SoulMap souls;
  OrbMap orbs;
  SpellMap spells;
  BuffMap buffs;
  std::map<Faction, Nexus> nexuses;

  Soul* find_soul(SoulId id) {
    auto it = souls.find(id);
    return it == souls.end() ? nullptr : &it->second;
  }

  const Soul* find_soul(SoulId id) const {
    auto it = souls.find(id);
    return it == souls.end() ? nullptr : &it->second;
  }

  Nexus* nexus(Faction faction) {
    auto it = nexuses.find(faction);
    return it == nexuses.end() ? nullptr : &it->second;
  }

  const Nexus* nexus(Faction faction) const {
    auto it = nexuses.find(faction);
    return it == nexuses.end() ? nullptr : &it->second;
  }

  const ActiveSpell* spell_by_caster(SoulId caster) const {
    for (const auto& [id, spell] : spells) {
      if (spell.caster == caster) {
        return &spell;
      }
    }
    return nullptr;
  }

  // Living adults of a faction.
  int adult_count(Faction faction, double now, double maturity_time) const {
    int count = 0;
    for (const auto& [id, soul] : souls) {
      if (soul.faction == faction && !soul.dead && soul.is_adult(now, maturity_time)) {
        ++count;
      }
    }
    return count;
  }

  // Living souls of a faction, children included.
  int population(Faction faction) const {
    int count = 0;
    for (const auto& [id, soul] : souls) {
      if (soul.faction == faction && !soul.dead) {
        ++count;
      }
    }
    return count;
  }

  SoulId next_soul_id() {
    return SoulId{++soul_counter_};
  }
  OrbId next_orb_id() {
    return OrbId{++orb_counter_};
  }
  SpellId next_spell_id() {
    return SpellId{++spell_counter_};
  }
  BuffId next_buff_id() {
    return BuffId{++buff_counter_};
  }

 private:
  std::uint32_t soul_counter_ = 0;
  std::uint32_t orb_counter_ = 0;
  std::uint32_t spell_counter_ = 0;
  std::uint32_t buff_counter_ = 0;
};

}  // namespace soulwar
