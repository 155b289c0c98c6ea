#pragma once
#include <tanksim/vec2.hpp>

namespace tanksim {

// Axis-aligned bounding box. Invariant: min.x <= max.x and min.y <= max.y.
struct AABB {
  Vec2 min{};
  Vec2 max{};

  // Order-independent: each axis takes the pairwise min and max of a and b.
  static constexpr AABB from_corners(const Vec2& a, const Vec2& b) {
    return AABB{
      Vec2{tanksim::min(a.x, b.x), tanksim::min(a.y, b.y)},
      Vec2{tanksim::max(a.x, b.x), tanksim::max(a.y, b.y)}
    };
  }

  // Box of extent `size` centered on `center` (half the size on each side).
  static constexpr AABB from_size(const Vec2& center, const Vec2& size) {
    const Vec2 half = size / 2;
    return from_corners(center - half, center + half);
  }

  constexpr Vec2 center() const { return (min + max) / 2; }
  constexpr Vec2 size() const { return max - min; }

  // Edges count as inside.
  constexpr bool contains(const Vec2& p) const {
    return min.x <= p.x && p.x <= max.x && min.y <= p.y && p.y <= max.y;
  }
  constexpr bool overlaps(const AABB& o) const {
    return min.x <= o.max.x && o.min.x <= max.x && min.y <= o.max.y && o.min.y <= max.y;
  }

  friend constexpr bool operator==(const AABB&, const AABB&) = default;
};

} // namespace tanksim
