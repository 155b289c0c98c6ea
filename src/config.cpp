#include <tanksim/config.hpp>
#include <tanksim/log.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <system_error>
#include <vector>

namespace tanksim {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // No quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return cols.size() == 2 && (cols[0] == "key" || cols[0] == "Key");
}

static bool to_u32(const std::string& s, std::uint32_t& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

static bool to_scalar(const std::string& s, Scalar& out) {
  const auto v = Scalar::parse(s);
  if (!v) return false;
  out = *v;
  return true;
}

static bool apply_row(ArenaConfig& cfg, const std::string& key, const std::string& value) {
  if (key == "map_width")     return to_scalar(value, cfg.map_width);
  if (key == "map_height")    return to_scalar(value, cfg.map_height);
  if (key == "grid_width")    return to_u32(value, cfg.grid_width);
  if (key == "grid_height")   return to_u32(value, cfg.grid_height);
  if (key == "tank_width")    return to_scalar(value, cfg.tank_size.x);
  if (key == "tank_height")   return to_scalar(value, cfg.tank_size.y);
  if (key == "bullet_width")  return to_scalar(value, cfg.bullet_size.x);
  if (key == "bullet_height") return to_scalar(value, cfg.bullet_size.y);
  return false;
}

// Mirrors what SpatialHashMap accepts, plus non-negative entity extents.
static bool is_valid(const ArenaConfig& cfg) {
  if (cfg.map_width <= 0 || cfg.map_height <= 0) return false;
  if (cfg.grid_width == 0 || cfg.grid_height == 0) return false;
  if ((cfg.map_width / cfg.grid_width).is_zero() || (cfg.map_height / cfg.grid_height).is_zero()) return false;
  if (static_cast<std::uint64_t>(cfg.grid_width) * cfg.grid_height > UINT32_MAX) return false;
  return cfg.tank_size.x >= 0 && cfg.tank_size.y >= 0 && cfg.bullet_size.x >= 0 && cfg.bullet_size.y >= 0;
}

std::optional<ArenaConfig> arena_config_from_stream(std::istream& in) {
  ArenaConfig cfg;
  std::string line;
  bool header_consumed = false;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (cols.size() != 2 || !apply_row(cfg, cols[0], cols[1])) {
      log_warning(kLogConfig, "line " + std::to_string(line_no) + ": bad row '" + raw + "'");
      return std::nullopt;
    }
  }

  if (!is_valid(cfg)) {
    log_warning(kLogConfig, "arena geometry out of range");
    return std::nullopt;
  }
  return cfg;
}

std::optional<ArenaConfig> load_arena_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return arena_config_from_stream(f);
}

} // namespace tanksim
