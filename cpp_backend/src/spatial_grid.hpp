#pragma once

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>
#include <vector>

namespace soulwar {

// Uniform grid of ids bucketed by world position, rebuilt each tick.
// Queries return ids in ascending order so callers that resolve pairs stay
// deterministic regardless of bucket layout.
template <typename IdT>
class SpatialGrid {
 public:
  explicit SpatialGrid(double cell_size) : cell_size_(cell_size) {}

  void clear() {
    cells_.clear();
  }

  void insert(IdT id, double x, double y) {
    cells_[cell_of(x, y)].push_back(id);
  }

  // Every id in the cells overlapping the square of half-width `radius`
  // around (x, y). Callers filter by exact distance.
  std::vector<IdT> near(double x, double y, double radius) const {
    auto [min_cx, min_cy] = cell_of(x - radius, y - radius);
    auto [max_cx, max_cy] = cell_of(x + radius, y + radius);
    std::vector<IdT> out;
    for (auto it = cells_.lower_bound({min_cx, min_cy}); it != cells_.end() && it->first.first <= max_cx; ++it) {
      int cy = it->first.second;
      if (cy < min_cy || cy > max_cy) {
        continue;
      }
      out.insert(out.end(), it->second.begin(), it->second.end());
    }
    std::sort(out.begin(), out.end());
    return out;
  }

 private:
  using Cell = std::pair<int, int>;

  Cell cell_of(double x, double y) const {
    return {static_cast<int>(std::floor(x / cell_size_)), static_cast<int>(std::floor(y / cell_size_))};
  }

  double cell_size_;
  std::map<Cell, std::vector<IdT>> cells_;
};

}  // namespace soulwar
