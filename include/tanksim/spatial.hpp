#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>
#include <tanksim/aabb.hpp>

namespace tanksim {

using ObjectId = std::uint32_t;
using CellKey = std::uint32_t;

// Sorted, duplicate-free object ids. Iteration order is the id order.
using IdSet = std::vector<ObjectId>;

// Cell keys of an inclusive index rectangle, row-major (y outer, x inner),
// each key linearized as x + y * grid_width. Produced on demand; iterating
// twice yields the same sequence.
class CellKeyRange {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = CellKey;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = CellKey;

    iterator() = default;

    CellKey operator*() const { return static_cast<CellKey>(x_ + y_ * grid_width_); }

    iterator& operator++() {
      if (x_ == max_x_) {
        x_ = min_x_;
        ++y_;
      } else {
        ++x_;
      }
      return *this;
    }
    iterator operator++(int) {
      iterator prev = *this;
      ++*this;
      return prev;
    }

    friend bool operator==(const iterator& a, const iterator& b) { return a.x_ == b.x_ && a.y_ == b.y_; }

  private:
    friend class CellKeyRange;
    iterator(std::uint32_t x, std::uint64_t y, std::uint32_t min_x, std::uint32_t max_x, std::uint32_t grid_width)
      : x_(x), y_(y), min_x_(min_x), max_x_(max_x), grid_width_(grid_width) {}

    std::uint32_t x_{0};
    std::uint64_t y_{0}; // wide so the end row past UINT32_MAX does not wrap
    std::uint32_t min_x_{0};
    std::uint32_t max_x_{0};
    std::uint32_t grid_width_{0};
  };

  CellKeyRange() = default;
  // An inverted rectangle (min > max on either axis) is an empty range.
  CellKeyRange(std::uint32_t min_x, std::uint32_t min_y, std::uint32_t max_x, std::uint32_t max_y,
               std::uint32_t grid_width);

  iterator begin() const;
  iterator end() const;

  bool empty() const { return empty_; }
  std::size_t size() const;

  std::uint32_t min_x() const { return min_x_; }
  std::uint32_t min_y() const { return min_y_; }
  std::uint32_t max_x() const { return max_x_; }
  std::uint32_t max_y() const { return max_y_; }

private:
  std::uint32_t min_x_{0};
  std::uint32_t min_y_{0};
  std::uint32_t max_x_{0};
  std::uint32_t max_y_{0};
  std::uint32_t grid_width_{0};
  bool empty_{true};
};

// Uniform grid over [0, map_width] x [0, map_height] used as a broad phase.
// The grid is a per-tick index: clear() it, insert() every entity, then
// query(). Results are over-inclusive (whole cells); exact tests belong to
// the caller. Not thread-safe; give each simulation replica its own grid.
class SpatialHashMap {
public:
  // Throws std::invalid_argument for non-positive map dimensions or a zero
  // cell count on either axis.
  SpatialHashMap(Scalar map_width, Scalar map_height, std::uint32_t grid_width, std::uint32_t grid_height);

  // Cells touched by aabb. Coordinates are clamped to the map first, then
  // indices to the grid, so boxes outside the map land in the edge cells.
  CellKeyRange keys(const AABB& aabb) const;

  // Adds id to every cell of keys(aabb). Repeated inserts are no-ops.
  void insert(ObjectId id, const AABB& aabb);

  // Union of the ids in every cell of keys(aabb).
  IdSet query(const AABB& aabb) const;

  // Ids in one cell, or an empty set when key is not a valid cell.
  IdSet get(CellKey key) const;

  // Empties every cell; dimensions stay.
  void clear();

  Scalar map_width() const { return map_width_; }
  Scalar map_height() const { return map_height_; }
  std::uint32_t grid_width() const { return grid_width_; }
  std::uint32_t grid_height() const { return grid_height_; }
  Scalar cell_width() const { return cell_width_; }
  Scalar cell_height() const { return cell_height_; }
  std::size_t cell_count() const { return cells_.size(); }
  std::size_t occupied_cells() const;

private:
  static std::uint32_t cell_index_(Scalar coord, Scalar limit, Scalar inv_cell, std::uint32_t cells);

  Scalar map_width_;
  Scalar map_height_;
  std::uint32_t grid_width_;
  std::uint32_t grid_height_;
  Scalar cell_width_;
  Scalar cell_height_;
  Scalar inv_cell_width_;
  Scalar inv_cell_height_;
  std::vector<IdSet> cells_;
};

} // namespace tanksim
