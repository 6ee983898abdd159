#pragma once

#include "config.hpp"
#include "models.hpp"

namespace soulwar {

// Builds a soul with randomized starting energy. Children start at the
// bottom of the starting range and mature over child_maturity_time.
Soul make_soul(SoulId id, Faction faction, double x, double y, double now, bool child, const config::Config& cfg,
               Rng& rng);

// Per-tick upkeep that is independent of behavior: random energy drain,
// retreat expiry and the dead flag.
void update_vitals(Soul& soul, double now, const config::Config& cfg, Rng& rng);

void record_position(Soul& soul, const config::Config& cfg);

}  // namespace soulwar
