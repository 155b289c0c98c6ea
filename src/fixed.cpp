#include <tanksim/fixed.hpp>
#include <cmath>
#include <ostream>

namespace tanksim {

namespace detail {

uwide_int isqrt(uwide_int& n) {
  uwide_int root = 0;
  uwide_int bit = uwide_int{1} << 126;
  while (bit > n) bit >>= 2;
  while (bit != 0) {
    if (n >= root + bit) {
      n -= root + bit;
      root = (root >> 1) + bit;
    } else {
      root >>= 1;
    }
    bit >>= 2;
  }
  return root;
}

} // namespace detail

namespace {

using detail::uwide_int;
using detail::wide_int;

// Intermediate precision: 18 fractional digits.
constexpr wide_int kWideOne = 1'000'000'000'000'000'000;
constexpr wide_int kNarrowToWide = kWideOne / Scalar::kScale;

// Angle constants at intermediate precision (rounded to nearest).
constexpr wide_int kWidePi         = 3'141'592'653'589'793'238;
constexpr wide_int kWideHalfPi     = 1'570'796'326'794'896'619;
constexpr wide_int kWideQuarterPi  =   785'398'163'397'448'310;
constexpr wide_int kWideSixthPi    =   523'598'775'598'298'873;
constexpr wide_int kWideTwoPi      = 6'283'185'307'179'586'477;
constexpr wide_int kWideSqrt3      = 1'732'050'807'568'877'294;
constexpr wide_int kWideTanPi12    =   267'949'192'431'122'706; // 2 - sqrt(3)

wide_int to_wide(Scalar s) { return static_cast<wide_int>(s.raw()) * kNarrowToWide; }

Scalar to_narrow(wide_int w) { return Scalar::from_raw(detail::div_round(w, kNarrowToWide)); }

// Products and quotients at intermediate precision truncate; only the final
// narrowing rounds.
wide_int wmul(wide_int a, wide_int b) { return a * b / kWideOne; }
wide_int wdiv(wide_int a, wide_int b) { return a * kWideOne / b; }

// Taylor series for |t| <= pi/4, summed until the next term vanishes.
wide_int sin_series(wide_int t) {
  const wide_int t2 = wmul(t, t);
  wide_int term = t;
  wide_int sum = t;
  for (int k = 1; term != 0; ++k) {
    term = -wmul(term, t2) / ((2 * k) * (2 * k + 1));
    sum += term;
  }
  return sum;
}

wide_int cos_series(wide_int t) {
  const wide_int t2 = wmul(t, t);
  wide_int term = kWideOne;
  wide_int sum = kWideOne;
  for (int k = 1; term != 0; ++k) {
    term = -wmul(term, t2) / ((2 * k - 1) * (2 * k));
    sum += term;
  }
  return sum;
}

struct SinCos {
  wide_int sin;
  wide_int cos;
};

SinCos sin_cos_wide(Scalar angle) {
  wide_int r = to_wide(angle) % kWideTwoPi;
  if (r < 0) r += kWideTwoPi;

  // Quadrant, then fold the remainder into [0, pi/4] around pi/4.
  wide_int q = r / kWideHalfPi;
  if (q > 3) q = 3;
  const wide_int t = r - q * kWideHalfPi;

  wide_int s, c;
  if (t <= kWideQuarterPi) {
    s = sin_series(t);
    c = cos_series(t);
  } else {
    const wide_int u = kWideHalfPi - t;
    s = cos_series(u);
    c = sin_series(u);
  }

  switch (static_cast<int>(q)) {
    case 0:  return {s, c};
    case 1:  return {c, -s};
    case 2:  return {-s, -c};
    default: return {-c, s};
  }
}

// atan(z) for 0 <= z <= 1.
wide_int atan_unit(wide_int z) {
  wide_int offset = 0;
  if (z > kWideTanPi12) {
    // atan(z) = pi/6 + atan((sqrt(3) z - 1) / (sqrt(3) + z))
    z = wdiv(wmul(kWideSqrt3, z) - kWideOne, kWideSqrt3 + z);
    offset = kWideSixthPi;
  }
  const wide_int z2 = wmul(z, z);
  wide_int power = z;
  wide_int sum = z;
  for (int k = 1; power != 0; ++k) {
    power = wmul(power, z2);
    const wide_int term = power / (2 * k + 1);
    sum += (k % 2 != 0) ? -term : term;
  }
  return offset + sum;
}

// Round a root to nearest given the remainder left by isqrt:
// (root + 1/2)^2 = root^2 + root + 1/4.
Scalar round_root(uwide_int root, uwide_int remainder) {
  if (remainder > root) ++root;
  if (root > static_cast<uwide_int>(std::numeric_limits<Scalar::raw_type>::max())) {
    throw ArithmeticError("scalar overflow");
  }
  return Scalar::from_raw(static_cast<Scalar::raw_type>(root));
}

} // namespace

Scalar sqrt(Scalar s) {
  if (s < 0) throw ArithmeticError("sqrt of a negative scalar");
  // sqrt(raw / 10^9) * 10^9 == sqrt(raw * 10^9)
  uwide_int n = static_cast<uwide_int>(s.raw()) * static_cast<uwide_int>(Scalar::kScale);
  const uwide_int root = detail::isqrt(n);
  return round_root(root, n);
}

Scalar hypot(Scalar x, Scalar y) {
  // Raw units in, raw units out: sqrt(xr^2 + yr^2). Each square is below
  // 2^126, so the sum fits.
  const uwide_int ax = detail::magnitude(x.raw());
  const uwide_int ay = detail::magnitude(y.raw());
  uwide_int n = ax * ax + ay * ay;
  const uwide_int root = detail::isqrt(n);
  return round_root(root, n);
}

Scalar sin(Scalar angle) { return to_narrow(sin_cos_wide(angle).sin); }

Scalar cos(Scalar angle) { return to_narrow(sin_cos_wide(angle).cos); }

Scalar atan2(Scalar y, Scalar x) {
  if (y.is_zero() && x.is_zero()) return Scalar{};

  const wide_int ax = x.raw() < 0 ? -static_cast<wide_int>(x.raw()) : x.raw();
  const wide_int ay = y.raw() < 0 ? -static_cast<wide_int>(y.raw()) : y.raw();

  wide_int a = (ay <= ax) ? atan_unit(ay * kWideOne / ax)
                          : kWideHalfPi - atan_unit(ax * kWideOne / ay);
  if (x < 0) a = kWidePi - a;
  if (y < 0) a = -a;

  Scalar out = to_narrow(a);
  // Keep the result inside (-pi, pi].
  if (out <= -Scalar::pi()) out = Scalar::from_raw(-Scalar::pi().raw() + 1);
  return out;
}

Scalar Scalar::from_double(double v) {
  if (!std::isfinite(v)) throw ArithmeticError("scalar from non-finite double");
  if (v == 0.0) return Scalar{};

  // v == mant * 2^exp exactly, with |mant| < 2^53.
  int exp = 0;
  const double frac = std::frexp(v, &exp);
  const auto mant = static_cast<std::int64_t>(std::ldexp(frac, 53));
  exp -= 53;

  // exp >= 0 means |v| >= 2^52, far past the raw range.
  if (exp >= 0) throw ArithmeticError("scalar overflow");

  const wide_int scaled = static_cast<wide_int>(mant) * kScale;
  // |scaled| < 2^83, so a divisor of 2^120 or more rounds to zero.
  if (-exp >= 120) return Scalar{};
  return from_raw(detail::div_round(scaled, wide_int{1} << -exp));
}

std::string Scalar::to_string() const {
  const bool negative = raw_ < 0;
  // Magnitude of INT64_MIN does not fit in int64.
  const std::uint64_t mag = negative ? std::uint64_t{0} - static_cast<std::uint64_t>(raw_)
                                     : static_cast<std::uint64_t>(raw_);
  const std::uint64_t int_part = mag / static_cast<std::uint64_t>(kScale);
  std::uint64_t frac = mag % static_cast<std::uint64_t>(kScale);

  std::string out;
  if (negative) out.push_back('-');
  out += std::to_string(int_part);
  if (frac != 0) {
    std::string digits(kDigits, '0');
    for (int i = kDigits - 1; i >= 0; --i) {
      digits[static_cast<std::size_t>(i)] = static_cast<char>('0' + frac % 10);
      frac /= 10;
    }
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    out.push_back('.');
    out += digits;
  }
  return out;
}

std::ostream& operator<<(std::ostream& os, Scalar s) { return os << s.to_string(); }

} // namespace tanksim
