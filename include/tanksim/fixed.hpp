#pragma once
#include <compare>
#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tanksim {

// Raised when an arithmetic operation has no representable result
// (overflow, division by zero, sqrt of a negative number).
class ArithmeticError : public std::domain_error {
public:
  using std::domain_error::domain_error;
};

namespace detail {

__extension__ typedef __int128 wide_int;
__extension__ typedef unsigned __int128 uwide_int;

// |v| without the int64 overflow at INT64_MIN.
constexpr uwide_int magnitude(std::int64_t v) {
  return v < 0 ? uwide_int{0} - static_cast<uwide_int>(v) : static_cast<uwide_int>(v);
}

// floor(sqrt(n)); the remainder n - root^2 is left in n.
uwide_int isqrt(uwide_int& n);

constexpr std::int64_t narrow(wide_int v) {
  if (v > std::numeric_limits<std::int64_t>::max() || v < std::numeric_limits<std::int64_t>::min()) {
    throw ArithmeticError("scalar overflow");
  }
  return static_cast<std::int64_t>(v);
}

// Round num/den to the nearest integer, ties to even. den != 0.
constexpr std::int64_t div_round(wide_int num, wide_int den) {
  wide_int q = num / den;
  const wide_int r = num % den;
  if (r != 0) {
    const wide_int twice = r < 0 ? -2 * r : 2 * r;
    const wide_int mag = den < 0 ? -den : den;
    if (twice > mag || (twice == mag && q % 2 != 0)) {
      q += ((num < 0) != (den < 0)) ? -1 : 1;
    }
  }
  return narrow(q);
}

} // namespace detail

// Decimal fixed-point number with nine fractional digits: value = raw / 10^9.
// All operations are integer arithmetic, so identical inputs give identical
// bits on every compiler and platform.
class Scalar {
public:
  using raw_type = std::int64_t;
  static constexpr raw_type kScale = 1'000'000'000;
  static constexpr int kDigits = 9;

  constexpr Scalar() = default;

  template <std::integral I>
  constexpr Scalar(I v) : raw_(detail::narrow(static_cast<detail::wide_int>(v) * kScale)) {}

  static constexpr Scalar from_raw(raw_type raw) {
    Scalar s;
    s.raw_ = raw;
    return s;
  }

  // Nearest Scalar to a host-side double (ties to even), for setup code that
  // starts from floating-point data. The conversion is exact integer math on
  // the double's bits, but simulation code should still take its inputs from
  // parse() or integers so replicas never depend on how a double was produced.
  // Throws ArithmeticError for NaN, infinities and out-of-range values.
  static Scalar from_double(double v);

  // Exact decimal text: [+-]digits[.digits]. Fraction digits past the ninth
  // round half to even. Returns nullopt on malformed or out-of-range text.
  static constexpr std::optional<Scalar> parse(std::string_view text);

  // Canonical π. Every angle constant derives from this one value.
  static constexpr Scalar pi() { return from_raw(3'141'592'654); }
  static constexpr Scalar half_pi() { return pi() / 2; }
  static constexpr Scalar two_pi() { return pi() * 2; }

  constexpr raw_type raw() const { return raw_; }
  constexpr bool is_zero() const { return raw_ == 0; }
  // Integer part, truncated toward zero.
  constexpr std::int64_t to_int() const { return raw_ / kScale; }

  std::string to_string() const;

  friend constexpr bool operator==(const Scalar&, const Scalar&) = default;
  friend constexpr auto operator<=>(const Scalar&, const Scalar&) = default;

  friend constexpr Scalar operator+(Scalar a, Scalar b) {
    return from_raw(detail::narrow(static_cast<detail::wide_int>(a.raw_) + b.raw_));
  }
  friend constexpr Scalar operator-(Scalar a, Scalar b) {
    return from_raw(detail::narrow(static_cast<detail::wide_int>(a.raw_) - b.raw_));
  }
  friend constexpr Scalar operator*(Scalar a, Scalar b) {
    return from_raw(detail::div_round(static_cast<detail::wide_int>(a.raw_) * b.raw_, kScale));
  }
  friend constexpr Scalar operator/(Scalar a, Scalar b) {
    if (b.raw_ == 0) throw ArithmeticError("scalar division by zero");
    return from_raw(detail::div_round(static_cast<detail::wide_int>(a.raw_) * kScale, b.raw_));
  }
  constexpr Scalar operator-() const { return from_raw(detail::narrow(-static_cast<detail::wide_int>(raw_))); }

  constexpr Scalar& operator+=(Scalar o) { return *this = *this + o; }
  constexpr Scalar& operator-=(Scalar o) { return *this = *this - o; }
  constexpr Scalar& operator*=(Scalar o) { return *this = *this * o; }
  constexpr Scalar& operator/=(Scalar o) { return *this = *this / o; }

private:
  raw_type raw_{0};
};

constexpr std::optional<Scalar> Scalar::parse(std::string_view text) {
  // Largest integer part that can still fit once scaled.
  constexpr detail::wide_int kMaxInt = std::numeric_limits<raw_type>::max() / kScale + 1;

  std::size_t i = 0;
  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }

  auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
  bool any_digit = false;

  detail::wide_int int_part = 0;
  for (; i < text.size() && is_digit(text[i]); ++i) {
    int_part = int_part * 10 + (text[i] - '0');
    any_digit = true;
    if (int_part > kMaxInt) return std::nullopt;
  }

  detail::wide_int frac = 0;
  int frac_digits = 0;
  int round_digit = -1; // first digit past the ninth
  bool sticky = false;  // any nonzero digit after round_digit
  if (i < text.size() && text[i] == '.') {
    ++i;
    for (; i < text.size() && is_digit(text[i]); ++i) {
      const int d = text[i] - '0';
      any_digit = true;
      if (frac_digits < kDigits) {
        frac = frac * 10 + d;
        ++frac_digits;
      } else if (round_digit < 0) {
        round_digit = d;
      } else if (d != 0) {
        sticky = true;
      }
    }
  }
  if (!any_digit || i != text.size()) return std::nullopt;

  for (; frac_digits < kDigits; ++frac_digits) frac *= 10;
  detail::wide_int mag = int_part * kScale + frac;
  if (round_digit > 5 || (round_digit == 5 && (sticky || mag % 2 != 0))) ++mag;
  if (negative) mag = -mag;

  if (mag > std::numeric_limits<raw_type>::max() || mag < std::numeric_limits<raw_type>::min()) {
    return std::nullopt;
  }
  return from_raw(static_cast<raw_type>(mag));
}

std::ostream& operator<<(std::ostream& os, Scalar s);

// --- Exact helpers

constexpr Scalar abs(Scalar s) { return s < 0 ? -s : s; }
constexpr Scalar min(Scalar a, Scalar b) { return b < a ? b : a; }
constexpr Scalar max(Scalar a, Scalar b) { return a < b ? b : a; }
constexpr Scalar clamp(Scalar v, Scalar lo, Scalar hi) { return v < lo ? lo : (hi < v ? hi : v); }

// Largest integer value not greater than s.
constexpr Scalar floor(Scalar s) {
  Scalar::raw_type q = s.raw() / Scalar::kScale;
  if (s.raw() % Scalar::kScale != 0 && s.raw() < 0) --q;
  return Scalar::from_raw(detail::narrow(static_cast<detail::wide_int>(q) * Scalar::kScale));
}

// --- Transcendentals (correctly rounded from a 10^18 intermediate)

Scalar sqrt(Scalar s);
// sqrt(x^2 + y^2) from the exact 128-bit sum of squares: no intermediate
// rounding and no overflow while the result fits.
Scalar hypot(Scalar x, Scalar y);
Scalar sin(Scalar angle);
Scalar cos(Scalar angle);
// Angle of (x, y) in (-pi, pi]; atan2(0, 0) == 0.
Scalar atan2(Scalar y, Scalar x);

namespace literals {

// 1.25_sc: parsed exactly from the literal's text at compile time.
consteval Scalar operator""_sc(const char* text) {
  const auto v = Scalar::parse(text);
  if (!v) throw std::invalid_argument("malformed scalar literal");
  return *v;
}

} // namespace literals

} // namespace tanksim
