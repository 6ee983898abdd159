#pragma once

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace soulwar {

using Rng = std::mt19937;

inline double clamp(double value, double min_value, double max_value) {
  return std::min(std::max(value, min_value), max_value);
}

inline double distance_sq(double ax, double ay, double bx, double by) {
  double dx = ax - bx;
  double dy = ay - by;
  return dx * dx + dy * dy;
}

inline double distance(double ax, double ay, double bx, double by) {
  return std::sqrt(distance_sq(ax, ay, bx, by));
}

inline std::pair<double, double> unit_vec(double dx, double dy) {
  double mag_sq = dx * dx + dy * dy;
  if (mag_sq <= 1e-9) {
    return {1.0, 0.0};
  }
  double inv = 1.0 / std::sqrt(mag_sq);
  return {dx * inv, dy * inv};
}

inline double round_to(double value, int decimals) {
  double factor = std::pow(10.0, static_cast<double>(decimals));
  return std::round(value * factor) / factor;
}

inline double rand_uniform(Rng& rng, double min_value, double max_value) {
  if (max_value <= min_value) {
    return min_value;
  }
  std::uniform_real_distribution<double> dist(min_value, max_value);
  return dist(rng);
}

inline int rand_int(Rng& rng, int min_value, int max_value) {
  std::uniform_int_distribution<int> dist(min_value, max_value);
  return dist(rng);
}

inline bool rand_chance(Rng& rng, double probability) {
  return rand_uniform(rng, 0.0, 1.0) < probability;
}

}  // namespace soulwar
