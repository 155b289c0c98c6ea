#pragma once
#include <iosfwd>
#include <optional>
#include <tanksim/fixed.hpp>

namespace tanksim {

struct Polar {
  Scalar radius{};
  Scalar angle{}; // radians, (-pi, pi]

  friend constexpr bool operator==(const Polar&, const Polar&) = default;
};

// 2D vector of Scalars. Plain value: every operation returns a new vector.
struct Vec2 {
  Scalar x{};
  Scalar y{};

  static constexpr Vec2 zero() { return Vec2{}; }

  // (magnitude, angle) -> cartesian.
  static Vec2 from_angle(Scalar magnitude, Scalar angle);

  constexpr Scalar dot(const Vec2& o) const { return x * o.x + y * o.y; }
  // Signed area of the parallelogram spanned by *this and o.
  constexpr Scalar cross(const Vec2& o) const { return x * o.y - y * o.x; }
  constexpr Scalar length_squared() const { return dot(*this); }
  // Correctly rounded; exact in the squares, so no loss for tiny vectors and
  // no overflow for large ones.
  Scalar length() const;

  // Counter-clockwise rotation, angle in radians.
  Vec2 rotate(Scalar angle) const;

  // Unit vector with the same direction, each component rounded once from the
  // exact quotient. nullopt only for the zero vector.
  std::optional<Vec2> normalize() const;

  // (length, atan2(y, x))
  Polar to_polar() const;

  friend constexpr bool operator==(const Vec2&, const Vec2&) = default;
};

constexpr Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
constexpr Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }
constexpr Vec2 operator-(const Vec2& v) { return Vec2{-v.x, -v.y}; }
constexpr Vec2 operator*(const Vec2& v, Scalar k) { return Vec2{v.x * k, v.y * k}; }
constexpr Vec2 operator*(Scalar k, const Vec2& v) { return v * k; }
constexpr Vec2 operator/(const Vec2& v, Scalar k) { return Vec2{v.x / k, v.y / k}; }

std::ostream& operator<<(std::ostream& os, const Vec2& v);

} // namespace tanksim
