#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <tanksim/vec2.hpp>

namespace tanksim {

// Arena geometry and entity extents for one simulation.
struct ArenaConfig {
  Scalar map_width{1000};
  Scalar map_height{1000};
  std::uint32_t grid_width = 20;  // cells along x
  std::uint32_t grid_height = 20; // cells along y
  Vec2 tank_size{20, 20};
  Vec2 bullet_size{2, 2};

  friend bool operator==(const ArenaConfig&, const ArenaConfig&) = default;
};

// Reads `key,value` rows on top of the defaults. Keys: map_width, map_height,
// grid_width, grid_height, tank_width, tank_height, bullet_width,
// bullet_height. Blank lines and '#' comments are skipped, an optional
// `key,value` header row is allowed. Unknown keys, malformed values and
// geometry the grid cannot hold yield nullopt.
std::optional<ArenaConfig> arena_config_from_stream(std::istream& in);

// File variant; nullopt if the file cannot be opened.
std::optional<ArenaConfig> load_arena_config(const std::string& path);

} // namespace tanksim
