#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>

#include <tanksim/config.hpp>

using namespace tanksim;
using namespace tanksim::literals;

static std::string cfg_full = R"(key,value
map_width,800
map_height,600
grid_width,16
grid_height,12
tank_width,24
tank_height,18.5
bullet_width,1
bullet_height,1
)";

static std::string cfg_with_noise = R"(
# arena for the small ladder
 map_width , 400

grid_width,8
)";

TEST_CASE("ArenaConfig defaults") {
  const ArenaConfig cfg;
  REQUIRE(cfg.map_width == Scalar{1000});
  REQUIRE(cfg.map_height == Scalar{1000});
  REQUIRE(cfg.grid_width == 20);
  REQUIRE(cfg.grid_height == 20);
  REQUIRE(cfg.tank_size == Vec2{Scalar{20}, Scalar{20}});
  REQUIRE(cfg.bullet_size == Vec2{Scalar{2}, Scalar{2}});
}

TEST_CASE("arena_config_from_stream reads every key") {
  std::istringstream ss(cfg_full);
  auto cfg = arena_config_from_stream(ss);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->map_width == Scalar{800});
  REQUIRE(cfg->map_height == Scalar{600});
  REQUIRE(cfg->grid_width == 16);
  REQUIRE(cfg->grid_height == 12);
  REQUIRE(cfg->tank_size == Vec2{Scalar{24}, 18.5_sc});
  REQUIRE(cfg->bullet_size == Vec2{Scalar{1}, Scalar{1}});
}

TEST_CASE("arena_config_from_stream handles spaces, comments and missing keys") {
  std::istringstream ss(cfg_with_noise);
  auto cfg = arena_config_from_stream(ss);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->map_width == Scalar{400});
  REQUIRE(cfg->grid_width == 8);
  // Untouched keys keep their defaults.
  REQUIRE(cfg->map_height == Scalar{1000});
  REQUIRE(cfg->tank_size == ArenaConfig{}.tank_size);

  std::istringstream empty("");
  auto defaults = arena_config_from_stream(empty);
  REQUIRE(defaults.has_value());
  REQUIRE(*defaults == ArenaConfig{});
}

TEST_CASE("arena_config_from_stream rejects bad rows and geometry") {
  auto rejects = [](const std::string& text) {
    std::istringstream in(text);
    return !arena_config_from_stream(in).has_value();
  };

  REQUIRE(rejects("turret_speed,4\n"));
  REQUIRE(rejects("map_width\n"));
  REQUIRE(rejects("map_width,4,5\n"));
  REQUIRE(rejects("map_width,wide\n"));
  REQUIRE(rejects("grid_width,-3\n"));
  REQUIRE(rejects("grid_width,2.5\n"));
  REQUIRE(rejects("map_width,0\n"));
  REQUIRE(rejects("grid_height,0\n"));
  REQUIRE(rejects("tank_width,-1\n"));
  REQUIRE(rejects("map_width,0.000000001\ngrid_width,1000\n"));
}

TEST_CASE("load_arena_config returns nullopt on missing file") {
  auto none = load_arena_config("this_file_does_not_exist.csv");
  REQUIRE_FALSE(none.has_value());
}
