#include <tanksim/vec2.hpp>
#include <ostream>

namespace tanksim {

Vec2 Vec2::from_angle(Scalar magnitude, Scalar angle) {
  return Vec2{magnitude * cos(angle), magnitude * sin(angle)};
}

Scalar Vec2::length() const { return hypot(x, y); }

Vec2 Vec2::rotate(Scalar angle) const {
  const Scalar c = cos(angle);
  const Scalar s = sin(angle);
  return Vec2{x * c - y * s, x * s + y * c};
}

std::optional<Vec2> Vec2::normalize() const {
  using detail::uwide_int;
  using detail::wide_int;
  if (x.is_zero() && y.is_zero()) return std::nullopt;

  // Exact sum of squared raws, scaled by 4^k into [2^124, 2^128) so that its
  // root carries at least 62 significant bits whatever the vector's size.
  const uwide_int ax = detail::magnitude(x.raw());
  const uwide_int ay = detail::magnitude(y.raw());
  uwide_int n = ax * ax + ay * ay;
  int k = 0;
  while (n < (uwide_int{1} << 124)) {
    n <<= 2;
    ++k;
  }
  const auto root = static_cast<wide_int>(detail::isqrt(n)); // == |v| * 2^k, raw units

  // c / |v| == c * 2^k / root; |c| * 2^k <= root < 2^64 keeps the product in range.
  auto unit = [&](Scalar c) {
    const wide_int num = static_cast<wide_int>(c.raw()) * (wide_int{1} << k) * Scalar::kScale;
    return Scalar::from_raw(detail::div_round(num, root));
  };
  return Vec2{unit(x), unit(y)};
}

Polar Vec2::to_polar() const { return Polar{length(), atan2(y, x)}; }

std::ostream& operator<<(std::ostream& os, const Vec2& v) {
  return os << '(' << v.x << ", " << v.y << ')';
}

} // namespace tanksim
