#include <tanksim/spatial.hpp>
#include <tanksim/log.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace tanksim {

// ---------------- CellKeyRange ----------------

CellKeyRange::CellKeyRange(std::uint32_t min_x, std::uint32_t min_y, std::uint32_t max_x, std::uint32_t max_y,
                           std::uint32_t grid_width)
  : min_x_(min_x), min_y_(min_y), max_x_(max_x), max_y_(max_y), grid_width_(grid_width),
    empty_(min_x > max_x || min_y > max_y) {}

CellKeyRange::iterator CellKeyRange::begin() const {
  if (empty_) return end();
  return iterator(min_x_, min_y_, min_x_, max_x_, grid_width_);
}

// One row past the last: where operator++ lands after the final key.
CellKeyRange::iterator CellKeyRange::end() const {
  if (empty_) return iterator{};
  return iterator(min_x_, std::uint64_t{max_y_} + 1, min_x_, max_x_, grid_width_);
}

std::size_t CellKeyRange::size() const {
  if (empty_) return 0;
  const std::uint64_t width = std::uint64_t{max_x_} - min_x_ + 1;
  const std::uint64_t height = std::uint64_t{max_y_} - min_y_ + 1;
  return static_cast<std::size_t>(width * height);
}

// ---------------- SpatialHashMap ----------------

SpatialHashMap::SpatialHashMap(Scalar map_width, Scalar map_height, std::uint32_t grid_width,
                               std::uint32_t grid_height)
  : map_width_(map_width), map_height_(map_height), grid_width_(grid_width), grid_height_(grid_height) {
  if (map_width <= 0 || map_height <= 0) {
    throw std::invalid_argument("spatial grid: map dimensions must be positive");
  }
  if (grid_width == 0 || grid_height == 0) {
    throw std::invalid_argument("spatial grid: cell counts must be non-zero");
  }
  const std::uint64_t count = static_cast<std::uint64_t>(grid_width) * grid_height;
  if (count > std::numeric_limits<CellKey>::max()) {
    throw std::invalid_argument("spatial grid: too many cells for a 32-bit key");
  }

  cell_width_ = map_width / grid_width;
  cell_height_ = map_height / grid_height;
  if (cell_width_.is_zero() || cell_height_.is_zero()) {
    throw std::invalid_argument("spatial grid: cells smaller than the scalar resolution");
  }
  inv_cell_width_ = Scalar{1} / cell_width_;
  inv_cell_height_ = Scalar{1} / cell_height_;
  cells_.resize(static_cast<std::size_t>(count));

  log_debug(kLogGrid, "grid " + std::to_string(grid_width) + "x" + std::to_string(grid_height) +
                          " over " + map_width.to_string() + "x" + map_height.to_string() +
                          ", cell " + cell_width_.to_string() + "x" + cell_height_.to_string());
}

std::uint32_t SpatialHashMap::cell_index_(Scalar coord, Scalar limit, Scalar inv_cell, std::uint32_t cells) {
  // A coordinate equal to the map edge floors one past the last cell, hence
  // the second clamp in index space.
  const Scalar c = clamp(coord, Scalar{}, limit);
  const std::int64_t idx = floor(c * inv_cell).to_int();
  const std::int64_t last = static_cast<std::int64_t>(cells) - 1;
  return static_cast<std::uint32_t>(std::clamp<std::int64_t>(idx, 0, last));
}

CellKeyRange SpatialHashMap::keys(const AABB& aabb) const {
  const std::uint32_t min_x = cell_index_(aabb.min.x, map_width_, inv_cell_width_, grid_width_);
  const std::uint32_t min_y = cell_index_(aabb.min.y, map_height_, inv_cell_height_, grid_height_);
  const std::uint32_t max_x = cell_index_(aabb.max.x, map_width_, inv_cell_width_, grid_width_);
  const std::uint32_t max_y = cell_index_(aabb.max.y, map_height_, inv_cell_height_, grid_height_);
  return CellKeyRange(min_x, min_y, max_x, max_y, grid_width_);
}

void SpatialHashMap::insert(ObjectId id, const AABB& aabb) {
  for (CellKey key : keys(aabb)) {
    IdSet& cell = cells_[key];
    auto it = std::lower_bound(cell.begin(), cell.end(), id);
    if (it == cell.end() || *it != id) cell.insert(it, id);
  }
}

IdSet SpatialHashMap::query(const AABB& aabb) const {
  IdSet out;
  for (CellKey key : keys(aabb)) {
    const IdSet& cell = cells_[key];
    out.insert(out.end(), cell.begin(), cell.end());
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

IdSet SpatialHashMap::get(CellKey key) const {
  if (key >= cells_.size()) return {};
  return cells_[key];
}

void SpatialHashMap::clear() {
  for (IdSet& cell : cells_) cell.clear();
}

std::size_t SpatialHashMap::occupied_cells() const {
  return static_cast<std::size_t>(
    std::count_if(cells_.begin(), cells_.end(), [](const IdSet& cell) { return !cell.empty(); }));
}

} // namespace tanksim
