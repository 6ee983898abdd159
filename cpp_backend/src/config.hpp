#pragma once

#include <optional>
#include <string>

namespace soulwar::config {

struct DisasterSettings {
  bool enabled = true;
  double trigger_chance = 0.1;
  double cooldown = 180.0;
  double duration = 20.0;
  double death_fraction = 0.3;
  // Freezing snow: minimum gap between kill batches.
  double kill_interval = 2.0;
  // Meteorite storm: number of impact waves spread over the duration.
  int waves = 1;
  // Speed multiplier applied to both factions while active, 1.0 for none.
  double speed_multiplier = 1.0;
};

struct Config {
  // World and territory grid. All times are seconds; distances are world units.
  double world_width = 1500.0;
  double world_height = 900.0;
  double boundary_buffer = 50.0;
  int tiles_x = 60;
  int tiles_y = 60;
  double tile_width = 25.0;
  double tile_height = 15.0;

  int tick_rate = 30;
  double world_sync_interval = 10.0;
  std::optional<int> random_seed;

  double starting_energy_min = 80.0;
  double starting_energy_max = 100.0;
  double max_energy = 100.0;
  double movement_speed = 5.0;
  double hungry_threshold = 0.5;
  double casting_energy_cost = 0.25;
  double min_energy_to_cast = 50.0;
  double state_timeout = 15.0;
  double seeking_timeout = 15.0;
  double seeking_fallback_fraction = 0.5;
  double energy_drain_chance = 0.05;
  double energy_drain_amount = 1.0;
  double death_grace_period = 2.0;

  double attack_range = 200.0;
  double attack_cooldown = 2.0;
  double attack_damage_min = 15.0;
  double attack_damage_max = 25.0;

  double spell_cooldown = 20.0;
  double spell_range = 100.0;
  double spell_min_distance = 50.0;
  double spell_preparation_time = 1.0;
  double spell_cast_time = 3.0;
  int capture_radius = 1;

  double collision_radius = 40.0;
  double separation_force = 0.3;
  double search_radius = 1500.0;
  double wander_force = 0.2;
  double random_movement_force = 2.0;
  double retreat_distance_threshold = 200.0;
  double retreat_force_distance = 100.0;
  double retreat_duration = 5.0;

  // Navigation fallbacks.
  int position_history_length = 30;
  double stuck_distance = 5.0;
  int path_samples = 5;
  int escape_rings = 4;
  int escape_attempts_per_ring = 8;

  double barrier_distance = 50.0;
  int territory_check_radius = 3;
  double border_band = 100.0;

  int orbs_per_team = 8;
  double orb_energy = 25.0;
  double orb_respawn_min = 10.0;
  double orb_respawn_max = 15.0;
  double orb_collection_radius = 30.0;
  double orb_spawn_offset_x = 10.0;
  double orb_spawn_offset_y = 8.0;

  int souls_per_team = 8;
  int spawn_safe_distance = 3;

  int light_nexus_tile_x = 8;
  int light_nexus_tile_y = 51;
  int dark_nexus_tile_x = 51;
  int dark_nexus_tile_y = 8;
  int nexus_size = 8;
  double nexus_max_health = 1000.0;
  double nexus_regen_amount = 10.0;
  double nexus_regen_interval = 5.0;
  double nexus_spawn_offset = 40.0;
  // Respawn an adult at the nexus when a faction has no adults left.
  bool emergency_respawn = true;

  int min_resting_souls = 5;
  int max_souls_per_team = 10;
  double min_energy_for_mating = 0.5;
  double mating_range = 120.0;
  double mating_time = 10.0;
  double mating_cooldown = 30.0;
  double mating_check_interval = 3.0;
  double child_maturity_time = 30.0;

  double sleep_min_energy = 0.3;
  double sleep_max_energy = 0.9;
  double sleep_duration = 8.0;
  double sleep_energy_recovery = 25.0;

  double cycle_duration = 120.0;
  double day_fraction = 0.4;
  double dusk_fraction = 0.1;
  double night_fraction = 0.4;
  double dawn_fraction = 0.1;
  double phase_speed_multiplier = 1.2;
  double phase_cast_time_multiplier = 0.8;
  double phase_energy_multiplier = 1.5;

  double conquest_speed_multiplier = 1.1;
  double conquest_duration = 10.0;

  bool disasters_enabled = true;
  double disaster_check_interval = 30.0;
  DisasterSettings freezing_snow{true, 0.15, 180.0, 20.0, 0.3, 2.0, 1, 0.7};
  DisasterSettings meteorite_storm{true, 0.1, 240.0, 15.0, 0.2, 0.0, 3, 1.0};

  std::string log_level = "info";
  std::string log_file;
};

Config load_from_env();

// Throws std::invalid_argument describing the first violated constraint.
void validate(const Config& cfg);

}  // namespace soulwar::config
