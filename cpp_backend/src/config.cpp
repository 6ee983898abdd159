#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace soulwar::config {
namespace {

bool env_bool(const char* name, bool fallback) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return fallback;
  }
  std::string value(raw);
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
    return !std::isspace(ch);
  }));
  value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
    return !std::isspace(ch);
  }).base(), value.end());
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<int> env_int(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return std::nullopt;
  }
  try {
    return std::stoi(raw);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

int env_int(const char* name, int fallback) {
  return env_int(name).value_or(fallback);
}

double env_double(const char* name, double fallback) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return fallback;
  }
  try {
    return std::stod(raw);
  } catch (const std::exception&) {
    return fallback;
  }
}

std::string env_string(const char* name, const char* fallback) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return std::string(fallback ? fallback : "");
  }
  return std::string(raw);
}

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::invalid_argument(message);
  }
}

void validate_disaster(const char* name, const DisasterSettings& settings) {
  std::string prefix(name);
  require(settings.trigger_chance >= 0.0 && settings.trigger_chance <= 1.0,
          prefix + " trigger chance must be within [0, 1]");
  require(settings.death_fraction >= 0.0 && settings.death_fraction <= 1.0,
          prefix + " death fraction must be within [0, 1]");
  require(settings.duration > 0.0, prefix + " duration must be positive");
  require(settings.waves >= 1, prefix + " needs at least one wave");
  require(settings.speed_multiplier > 0.0, prefix + " speed multiplier must be positive");
}

bool nexus_fits(const Config& cfg, int tile_x, int tile_y) {
  int half = cfg.nexus_size / 2;
  return tile_x - half >= 0 && tile_y - half >= 0 && tile_x - half + cfg.nexus_size <= cfg.tiles_x &&
         tile_y - half + cfg.nexus_size <= cfg.tiles_y;
}

}  // namespace

Config load_from_env() {
  Config cfg;
  cfg.random_seed = env_int("SOULWAR_RANDOM_SEED");
  cfg.tick_rate = env_int("SOULWAR_TICK_RATE", cfg.tick_rate);
  cfg.tiles_x = env_int("SOULWAR_TILES_X", cfg.tiles_x);
  cfg.tiles_y = env_int("SOULWAR_TILES_Y", cfg.tiles_y);
  cfg.tile_width = env_double("SOULWAR_TILE_WIDTH", cfg.tile_width);
  cfg.tile_height = env_double("SOULWAR_TILE_HEIGHT", cfg.tile_height);
  cfg.world_width = env_double("SOULWAR_WORLD_WIDTH", cfg.tiles_x * cfg.tile_width);
  cfg.world_height = env_double("SOULWAR_WORLD_HEIGHT", cfg.tiles_y * cfg.tile_height);
  cfg.souls_per_team = std::max(0, env_int("SOULWAR_SOULS_PER_TEAM", cfg.souls_per_team));
  cfg.max_souls_per_team = std::max(1, env_int("SOULWAR_MAX_SOULS_PER_TEAM", cfg.max_souls_per_team));
  cfg.min_resting_souls = std::max(0, env_int("SOULWAR_MIN_RESTING_SOULS", cfg.min_resting_souls));
  cfg.orbs_per_team = std::max(0, env_int("SOULWAR_ORBS_PER_TEAM", cfg.orbs_per_team));
  cfg.disasters_enabled = env_bool("SOULWAR_DISASTERS_ENABLED", cfg.disasters_enabled);
  cfg.cycle_duration = env_double("SOULWAR_CYCLE_DURATION", cfg.cycle_duration);
  cfg.world_sync_interval = env_double("SOULWAR_WORLD_SYNC_INTERVAL", cfg.world_sync_interval);
  cfg.log_level = env_string("SOULWAR_LOG_LEVEL", cfg.log_level.c_str());
  cfg.log_file = env_string("SOULWAR_LOG_FILE", "");
  return cfg;
}

void validate(const Config& cfg) {
  require(cfg.world_width > 0.0 && cfg.world_height > 0.0, "world dimensions must be positive");
  require(cfg.tiles_x > 0 && cfg.tiles_y > 0, "tile grid must not be empty");
  require(cfg.tile_width > 0.0 && cfg.tile_height > 0.0, "tile dimensions must be positive");
  require(cfg.tiles_x * cfg.tile_width + 1e-6 >= cfg.world_width &&
              cfg.tiles_y * cfg.tile_height + 1e-6 >= cfg.world_height,
          "tile grid must cover the world");
  require(cfg.tick_rate > 0, "tick rate must be positive");
  require(cfg.boundary_buffer >= 0.0 && cfg.boundary_buffer * 2.0 < std::min(cfg.world_width, cfg.world_height),
          "boundary buffer leaves no playable area");
  require(cfg.max_energy > 0.0, "max energy must be positive");
  require(cfg.starting_energy_min > 0.0 && cfg.starting_energy_min <= cfg.starting_energy_max &&
              cfg.starting_energy_max <= cfg.max_energy,
          "starting energy range must lie within (0, max energy]");
  require(cfg.hungry_threshold > 0.0 && cfg.hungry_threshold < 1.0, "hunger threshold must be within (0, 1)");
  require(cfg.attack_damage_min >= 0.0 && cfg.attack_damage_min <= cfg.attack_damage_max,
          "attack damage range is inverted");
  require(cfg.orb_respawn_min >= 0.0 && cfg.orb_respawn_min <= cfg.orb_respawn_max, "orb respawn range is inverted");
  require(cfg.capture_radius >= 0, "capture radius must not be negative");
  require(cfg.nexus_size > 0, "nexus footprint must not be empty");
  require(nexus_fits(cfg, cfg.light_nexus_tile_x, cfg.light_nexus_tile_y), "light nexus footprint leaves the map");
  require(nexus_fits(cfg, cfg.dark_nexus_tile_x, cfg.dark_nexus_tile_y), "dark nexus footprint leaves the map");
  require(cfg.nexus_max_health > 0.0, "nexus health must be positive");
  require(cfg.min_resting_souls < cfg.max_souls_per_team, "resting reserve must be below the population cap");
  require(cfg.mating_check_interval > 0.0, "mating check interval must be positive");
  require(cfg.sleep_min_energy <= cfg.sleep_max_energy, "sleep energy band is inverted");
  require(cfg.cycle_duration > 0.0, "day/night cycle must be positive");
  double fractions = cfg.day_fraction + cfg.dusk_fraction + cfg.night_fraction + cfg.dawn_fraction;
  require(std::abs(fractions - 1.0) < 1e-6, "day/night phase fractions must sum to 1");
  require(cfg.position_history_length >= 2, "position history needs at least two samples");
  require(cfg.disaster_check_interval > 0.0, "disaster check interval must be positive");
  validate_disaster("freezing snow", cfg.freezing_snow);
  validate_disaster("meteorite storm", cfg.meteorite_storm);
}

}  // namespace soulwar::config
