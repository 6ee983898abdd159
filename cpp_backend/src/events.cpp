#include "events.hpp"

namespace soulwar {
namespace {

struct TypeName {
  const char* operator()(const event::SoulSpawned&) const { return "soul_spawned"; }
  const char* operator()(const event::SoulUpdated&) const { return "soul_updated"; }
  const char* operator()(const event::SoulDeath&) const { return "soul_death"; }
  const char* operator()(const event::SoulRemoved&) const { return "soul_removed"; }
  const char* operator()(const event::SoulMatured&) const { return "soul_matured"; }
  const char* operator()(const event::Attack&) const { return "attack"; }
  const char* operator()(const event::SpellStarted&) const { return "spell_started"; }
  const char* operator()(const event::SpellInterrupted&) const { return "spell_interrupted"; }
  const char* operator()(const event::SpellCompleted&) const { return "spell_completed"; }
  const char* operator()(const event::TileUpdated&) const { return "tile_updated"; }
  const char* operator()(const event::OrbSpawned&) const { return "orb_spawned"; }
  const char* operator()(const event::OrbCollected&) const { return "orb_collected"; }
  const char* operator()(const event::MatingStarted&) const { return "mating_started"; }
  const char* operator()(const event::MatingCompleted&) const { return "mating_completed"; }
  const char* operator()(const event::MatingCancelled&) const { return "mating_cancelled"; }
  const char* operator()(const event::DisasterStarted&) const { return "disaster_start"; }
  const char* operator()(const event::DisasterEnded&) const { return "disaster_end"; }
  const char* operator()(const event::MeteoriteImpact&) const { return "meteorite_impact"; }
  const char* operator()(const event::NexusAttack&) const { return "nexus_attack"; }
  const char* operator()(const event::NexusUpdate&) const { return "nexus_update"; }
  const char* operator()(const event::NexusDestroyed&) const { return "nexus_destroyed"; }
  const char* operator()(const event::BuffApplied&) const { return "buff_applied"; }
  const char* operator()(const event::BuffRemoved&) const { return "buff_removed"; }
  const char* operator()(const event::DayNightPhaseChange&) const { return "day_night_phase_change"; }
  const char* operator()(const event::EmergencyRespawn&) const { return "emergency_respawn"; }
};

}  // namespace

SoulView view_of(const Soul& soul, double now, const config::Config& cfg) {
  SoulView view;
  view.id = soul.id;
  view.faction = soul.faction;
  view.x = soul.x;
  view.y = soul.y;
  view.energy = soul.energy;
  view.max_energy = soul.max_energy;
  view.state = soul.state;
  view.casting = soul.is_casting();
  view.preparing = soul.is_preparing();
  view.defending = soul.is_defending();
  view.retreating = soul.retreating;
  view.child = soul.child && !soul.is_adult(now, cfg.child_maturity_time);
  view.maturity = soul.maturity(now, cfg.child_maturity_time);
  view.mating = soul.is_mating();
  view.mating_partner = soul.mating_partner;
  view.sleeping = soul.sleeping;
  view.sleep_progress = soul.sleep_progress(now, cfg.sleep_duration);
  view.dead = soul.dead;
  return view;
}

const char* event_type(const Event& ev) {
  return std::visit(TypeName{}, ev);
}

}  // namespace soulwar
