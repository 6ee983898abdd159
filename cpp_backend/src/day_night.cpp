#include "day_night.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

#include "buffs.hpp"

namespace soulwar {
namespace {

constexpr double kDayLight = 1.0;
constexpr double kNightLight = 0.3;

}  // namespace

DayNightSystem::DayNightSystem(const config::Config& cfg, double start_time) : cfg_(cfg), start_time_(start_time) {}

PhaseInfo DayNightSystem::info(double now) const {
  PhaseInfo out;
  double elapsed = std::max(0.0, now - start_time_);
  out.cycle = static_cast<long>(std::floor(elapsed / cfg_.cycle_duration));
  out.cycle_progress = (elapsed - static_cast<double>(out.cycle) * cfg_.cycle_duration) / cfg_.cycle_duration;

  double day_end = cfg_.day_fraction;
  double dusk_end = day_end + cfg_.dusk_fraction;
  double night_end = dusk_end + cfg_.night_fraction;
  double p = out.cycle_progress;

  auto within = [&](double begin, double end) {
    return end > begin ? clamp((p - begin) / (end - begin), 0.0, 1.0) : 1.0;
  };

  if (p < day_end) {
    out.phase = DayPhase::Day;
    out.phase_progress = within(0.0, day_end);
    out.ambient_light = kDayLight;
  } else if (p < dusk_end) {
    out.phase = DayPhase::Dusk;
    out.phase_progress = within(day_end, dusk_end);
    out.ambient_light = kDayLight + (kNightLight - kDayLight) * out.phase_progress;
  } else if (p < night_end) {
    out.phase = DayPhase::Night;
    out.phase_progress = within(dusk_end, night_end);
    out.ambient_light = kNightLight;
  } else {
    out.phase = DayPhase::Dawn;
    out.phase_progress = within(night_end, 1.0);
    out.ambient_light = kNightLight + (kDayLight - kNightLight) * out.phase_progress;
  }
  return out;
}

bool DayNightSystem::is_favored(Faction faction, double now) const {
  DayPhase p = phase(now);
  return (faction == Faction::Light && p == DayPhase::Day) || (faction == Faction::Dark && p == DayPhase::Night);
}

bool DayNightSystem::is_unfavored(Faction faction, double now) const {
  return is_favored(opponent(faction), now);
}

void DayNightSystem::update(WorldState& world, double now, EventList& events) {
  PhaseInfo state = info(now);
  if (current_ && *current_ == state.phase) {
    return;
  }
  DayPhase previous = current_.value_or(state.phase);
  current_ = state.phase;

  buffs::clear_source(world, BuffSource::DayNight, events);
  std::optional<Faction> favored;
  if (state.phase == DayPhase::Day) {
    favored = Faction::Light;
  } else if (state.phase == DayPhase::Night) {
    favored = Faction::Dark;
  }
  if (favored) {
    BuffEffects effects;
    effects.speed = cfg_.phase_speed_multiplier;
    effects.cast_time = cfg_.phase_cast_time_multiplier;
    effects.energy = cfg_.phase_energy_multiplier;
    const char* name = state.phase == DayPhase::Day ? "daylight_blessing" : "night_blessing";
    buffs::apply(world, BuffSource::DayNight, *favored, name, effects, now, std::nullopt, events);
  }

  events.emplace_back(event::DayNightPhaseChange{state.phase, previous, state.cycle_progress});
  spdlog::info("day/night phase is now {}", day_phase_name(state.phase));
}

}  // namespace soulwar
