#include <tanksim/state_io.hpp>
#include <tanksim/log.hpp>
#include <charconv>
#include <fstream>
#include <istream>
#include <locale>
#include <ostream>
#include <sstream>
#include <system_error>
#include <vector>

namespace tanksim {

namespace {

constexpr const char* kHeader = "tanksim-state";
constexpr const char* kVersion = "1";

void write_words(std::ostream& out, const std::vector<std::uint32_t>& words) {
  out << ' ' << words.size();
  for (std::uint32_t w : words) out << ' ' << w;
}

void write_vec(std::ostream& out, const Vec2& v) { out << ' ' << v.x << ' ' << v.y; }

// Puts the classic locale on a stream for the lifetime of the guard, so
// integers never pick up digit grouping from the caller's locale.
class ClassicLocale {
public:
  explicit ClassicLocale(std::ios_base& stream)
    : stream_(stream), prev_(stream.imbue(std::locale::classic())) {}
  ~ClassicLocale() { stream_.imbue(prev_); }
  ClassicLocale(const ClassicLocale&) = delete;
  ClassicLocale& operator=(const ClassicLocale&) = delete;

private:
  std::ios_base& stream_;
  std::locale prev_;
};

template <typename T>
bool parse_uint(const std::string& s, T& out) {
  const char* first = s.data();
  const char* last = first + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

// Splits input into whitespace-separated tokens, one non-blank line at a time.
class LineReader {
public:
  explicit LineReader(std::istream& in) : in_(in) {}

  bool next(std::vector<std::string>& tokens) {
    std::string line;
    while (std::getline(in_, line)) {
      ++line_no_;
      tokens.clear();
      std::istringstream ss(line);
      std::string tok;
      while (ss >> tok) tokens.push_back(tok);
      if (!tokens.empty()) return true;
    }
    return false;
  }

  std::size_t line_no() const { return line_no_; }

private:
  std::istream& in_;
  std::size_t line_no_{0};
};

// Cursor over the fields of one record, after its leading keyword.
struct Fields {
  const std::vector<std::string>& tok;
  std::size_t i = 1;

  bool u32(std::uint32_t& v) { return i < tok.size() && parse_uint(tok[i++], v); }
  bool u64(std::uint64_t& v) { return i < tok.size() && parse_uint(tok[i++], v); }
  bool scalar(Scalar& v) {
    if (i >= tok.size()) return false;
    const auto parsed = Scalar::parse(tok[i++]);
    if (!parsed) return false;
    v = *parsed;
    return true;
  }
  bool vec(Vec2& v) { return scalar(v.x) && scalar(v.y); }
  bool words(std::vector<std::uint32_t>& out) {
    std::uint32_t n = 0;
    if (!u32(n) || n > tok.size() - i) return false;
    out.clear();
    for (std::uint32_t k = 0; k < n; ++k) {
      std::uint32_t w = 0;
      if (!u32(w)) return false;
      out.push_back(w);
    }
    return true;
  }
  bool done() const { return i == tok.size(); }
};

bool keyed_u64(const std::vector<std::string>& tok, const char* key, std::uint64_t& v) {
  if (tok.empty() || tok[0] != key) return false;
  Fields f{tok};
  return f.u64(v) && f.done();
}

bool parse_tank(const std::vector<std::string>& tok, Tank& t) {
  if (tok.empty() || tok[0] != "tank") return false;
  Fields f{tok};
  return f.u32(t.id) && f.vec(t.position) && f.vec(t.velocity) && f.scalar(t.angle) &&
         f.scalar(t.turret_angle) && f.u32(t.health) && f.u32(t.team_id) && f.u32(t.vm.pc) &&
         f.u32(t.vm.sp) && f.words(t.vm.stack) && f.words(t.vm.memory) && f.done();
}

bool parse_bullet(const std::vector<std::string>& tok, Bullet& b) {
  if (tok.empty() || tok[0] != "bullet") return false;
  Fields f{tok};
  return f.u32(b.id) && f.vec(b.position) && f.vec(b.velocity) && f.done();
}

} // namespace

void write_state(std::ostream& out, const SimState& state) {
  const ClassicLocale classic(out);
  out << kHeader << ' ' << kVersion << '\n';
  out << "time " << state.time << '\n';
  out << "seed " << state.seed << '\n';

  out << "tanks " << state.tanks.size() << '\n';
  for (const auto& t : state.tanks) {
    out << "tank " << t.id;
    write_vec(out, t.position);
    write_vec(out, t.velocity);
    out << ' ' << t.angle << ' ' << t.turret_angle << ' ' << t.health << ' ' << t.team_id
        << ' ' << t.vm.pc << ' ' << t.vm.sp;
    write_words(out, t.vm.stack);
    write_words(out, t.vm.memory);
    out << '\n';
  }

  out << "bullets " << state.bullets.size() << '\n';
  for (const auto& b : state.bullets) {
    out << "bullet " << b.id;
    write_vec(out, b.position);
    write_vec(out, b.velocity);
    out << '\n';
  }
}

std::string state_to_string(const SimState& state) {
  std::ostringstream os;
  write_state(os, state);
  return os.str();
}

std::optional<SimState> read_state(std::istream& in) {
  LineReader reader(in);
  std::vector<std::string> tok;
  SimState s;

  auto reject = [&](const std::string& what) -> std::optional<SimState> {
    log_warning(kLogState, "line " + std::to_string(reader.line_no()) + ": " + what);
    return std::nullopt;
  };

  if (!reader.next(tok) || tok.size() != 2 || tok[0] != kHeader || tok[1] != kVersion) {
    return reject("expected header '" + std::string(kHeader) + " " + kVersion + "'");
  }
  if (!reader.next(tok) || !keyed_u64(tok, "time", s.time)) return reject("expected 'time <tick>'");
  if (!reader.next(tok) || !keyed_u64(tok, "seed", s.seed)) return reject("expected 'seed <value>'");

  std::uint64_t count = 0;
  if (!reader.next(tok) || !keyed_u64(tok, "tanks", count)) return reject("expected 'tanks <count>'");
  for (std::uint64_t k = 0; k < count; ++k) {
    Tank t;
    if (!reader.next(tok) || !parse_tank(tok, t)) return reject("malformed tank record");
    s.tanks.push_back(std::move(t));
  }

  if (!reader.next(tok) || !keyed_u64(tok, "bullets", count)) return reject("expected 'bullets <count>'");
  for (std::uint64_t k = 0; k < count; ++k) {
    Bullet b;
    if (!reader.next(tok) || !parse_bullet(tok, b)) return reject("malformed bullet record");
    s.bullets.push_back(b);
  }

  if (reader.next(tok)) return reject("unexpected content after bullets");
  return s;
}

bool save_state(const std::string& path, const SimState& state) {
  std::ofstream f(path);
  if (!f) {
    log_warning(kLogState, "cannot open " + path + " for writing");
    return false;
  }
  f << state_to_string(state);
  f.flush();
  if (!f) {
    log_warning(kLogState, "write to " + path + " failed");
    return false;
  }
  return true;
}

std::optional<SimState> load_state(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return read_state(f);
}

std::uint64_t state_hash(const SimState& state) {
  constexpr std::uint64_t kOffsetBasis = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffsetBasis;
  for (unsigned char c : state_to_string(state)) {
    hash ^= c;
    hash *= kPrime;
  }
  return hash;
}

} // namespace tanksim
