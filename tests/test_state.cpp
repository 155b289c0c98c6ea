#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <locale>
#include <sstream>
#include <string>
#include <utility>

#include <tanksim/state.hpp>
#include <tanksim/state_io.hpp>

using namespace tanksim;
using namespace tanksim::literals;

static SimState sample_state() {
  SimState s;
  s.time = 12;
  s.seed = 0xDEADBEEFCAFEull;

  Tank a;
  a.id = 7;
  a.position = Vec2{10.5_sc, -3.25_sc};
  a.velocity = Vec2{0.000000001_sc, Scalar{2}};
  a.angle = Scalar::half_pi();
  a.turret_angle = -Scalar::pi();
  a.health = 100;
  a.team_id = 2;
  a.vm.pc = 4;
  a.vm.sp = 2;
  a.vm.stack = {1, 2};
  a.vm.memory = {0, 4'294'967'295u, 9};

  Tank b;
  b.id = 3;
  b.position = Vec2{Scalar{400}, Scalar{400}};
  b.health = 50;
  b.team_id = 1;

  s.tanks = {a, b};
  s.bullets = {
    Bullet{11, Vec2{Scalar{1}, Scalar{1}}, Vec2{Scalar{5}, Scalar{}}},
    Bullet{10, Vec2{Scalar{-1}, 0.5_sc}, Vec2{Scalar{}, Scalar{-5}}},
  };
  return s;
}

TEST_CASE("state records compare structurally") {
  REQUIRE(SimState{} == SimState{});
  SimState a = sample_state();
  SimState b = sample_state();
  REQUIRE(a == b);

  b.tanks[0].vm.memory.push_back(1);
  REQUIRE_FALSE(a == b);

  // Order is part of the value.
  SimState c = sample_state();
  std::swap(c.tanks[0], c.tanks[1]);
  REQUIRE_FALSE(a == c);
}

TEST_CASE("find_tank and find_bullet look up by id") {
  const SimState s = sample_state();
  auto t = find_tank(s, 3);
  REQUIRE(t.has_value());
  REQUIRE(t->health == 50);
  REQUIRE_FALSE(find_tank(s, 99).has_value());

  auto b = find_bullet(s, 10);
  REQUIRE(b.has_value());
  REQUIRE(b->velocity == Vec2{Scalar{}, Scalar{-5}});
  REQUIRE_FALSE(find_bullet(s, 7).has_value());
}

TEST_CASE("write_state produces the documented text form") {
  SimState s;
  s.time = 3;
  s.seed = 9;
  Tank t;
  t.id = 1;
  t.position = Vec2{1.5_sc, Scalar{2}};
  t.health = 100;
  t.vm.stack = {5};
  s.tanks.push_back(t);
  s.bullets.push_back(Bullet{4, Vec2{Scalar{}, Scalar{}}, Vec2{Scalar{-1}, Scalar{}}});

  const std::string expected =
    "tanksim-state 1\n"
    "time 3\n"
    "seed 9\n"
    "tanks 1\n"
    "tank 1 1.5 2 0 0 0 0 100 0 0 0 1 5 0\n"
    "bullets 1\n"
    "bullet 4 0 0 -1 0\n";
  REQUIRE(state_to_string(s) == expected);
}

namespace {
struct GroupedThousands : std::numpunct<char> {
  char do_thousands_sep() const override { return ','; }
  std::string do_grouping() const override { return "\3"; }
};
} // namespace

TEST_CASE("write_state ignores the stream's locale and restores it") {
  SimState s = sample_state();
  s.time = 1'234'567;

  std::ostringstream os;
  const std::locale grouped(std::locale::classic(), new GroupedThousands);
  os.imbue(grouped);
  write_state(os, s);

  REQUIRE(os.str() == state_to_string(s));
  REQUIRE(os.str().find("time 1234567\n") != std::string::npos);

  std::istringstream in(os.str());
  const auto back = read_state(in);
  REQUIRE(back.has_value());
  REQUIRE(*back == s);

  std::ostringstream after;
  after.imbue(os.getloc());
  after << 1'234'567;
  REQUIRE(after.str() == "1,234,567");
}

TEST_CASE("read_state restores exactly what write_state wrote") {
  const SimState s = sample_state();
  std::stringstream ss;
  write_state(ss, s);

  auto back = read_state(ss);
  REQUIRE(back.has_value());
  REQUIRE(*back == s);
  REQUIRE(back->tanks[0].id == 7);
  REQUIRE(back->tanks[1].id == 3);
  REQUIRE(back->bullets[0].id == 11);

  SECTION("empty collections survive too") {
    std::stringstream empty;
    write_state(empty, SimState{});
    auto e = read_state(empty);
    REQUIRE(e.has_value());
    REQUIRE(*e == SimState{});
  }

  SECTION("blank lines are tolerated") {
    std::istringstream in("\ntanksim-state 1\n\ntime 1\nseed 2\ntanks 0\nbullets 0\n\n");
    auto r = read_state(in);
    REQUIRE(r.has_value());
    REQUIRE(r->time == 1);
    REQUIRE(r->seed == 2);
  }
}

TEST_CASE("read_state rejects malformed input") {
  auto rejects = [](const std::string& text) {
    std::istringstream in(text);
    return !read_state(in).has_value();
  };

  REQUIRE(rejects(""));
  REQUIRE(rejects("tanksim-state 2\ntime 0\nseed 0\ntanks 0\nbullets 0\n"));
  REQUIRE(rejects("tanksim-state 1\nseed 0\ntime 0\ntanks 0\nbullets 0\n"));
  REQUIRE(rejects("tanksim-state 1\ntime -1\nseed 0\ntanks 0\nbullets 0\n"));
  REQUIRE(rejects("tanksim-state 1\ntime 0\nseed 0\ntanks 1\nbullets 0\n"));
  REQUIRE(rejects("tanksim-state 1\ntime 0\nseed 0\ntanks 0\nbullets 1\n"));
  REQUIRE(rejects("tanksim-state 1\ntime 0\nseed 0\ntanks 0\nbullets 1\nbullet 1 0 0 0\n"));
  REQUIRE(rejects("tanksim-state 1\ntime 0\nseed 0\ntanks 0\nbullets 1\nbullet 1 0 0 0 x\n"));
  REQUIRE(rejects("tanksim-state 1\ntime 0\nseed 0\ntanks 0\nbullets 1\nbullet 1 0 0 0 0 0\n"));
  REQUIRE(rejects("tanksim-state 1\ntime 0\nseed 0\ntanks 1\ntank 1 0 0 0 0 0 0 100 0 0 0 2 5 0\nbullets 0\n"));
  REQUIRE(rejects("tanksim-state 1\ntime 0\nseed 0\ntanks 0\nbullets 0\nextra\n"));
}

TEST_CASE("state_hash tracks the encoded value") {
  const SimState s = sample_state();
  REQUIRE(state_hash(s) == state_hash(sample_state()));

  SimState moved = s;
  moved.bullets[1].position.x += Scalar::from_raw(1);
  REQUIRE(state_hash(moved) != state_hash(s));

  SimState reordered = s;
  std::swap(reordered.bullets[0], reordered.bullets[1]);
  REQUIRE(state_hash(reordered) != state_hash(s));
}

TEST_CASE("save_state and load_state go through a file") {
  const std::string path = "tanksim_state_roundtrip.txt";
  const SimState s = sample_state();
  REQUIRE(save_state(path, s));

  auto back = load_state(path);
  REQUIRE(back.has_value());
  REQUIRE(*back == s);
  std::remove(path.c_str());

  REQUIRE_FALSE(load_state("this_file_does_not_exist.txt").has_value());
}
