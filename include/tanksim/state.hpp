#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <tanksim/vec2.hpp>

namespace tanksim {

// Caller-assigned entity id. The core never allocates or recycles ids.
using EntityId = std::uint32_t;

struct Bullet {
  EntityId id = 0;
  Vec2 position{};
  Vec2 velocity{}; // units per tick

  friend bool operator==(const Bullet&, const Bullet&) = default;
};

// Program context of a tank. Carried and serialized, never interpreted.
struct VmState {
  std::uint32_t pc = 0;
  std::uint32_t sp = 0;
  std::vector<std::uint32_t> stack;
  std::vector<std::uint32_t> memory;

  friend bool operator==(const VmState&, const VmState&) = default;
};

struct Tank {
  EntityId id = 0;
  Vec2 position{};
  Vec2 velocity{};       // units per tick
  Scalar angle{};        // hull heading (rad)
  Scalar turret_angle{}; // (rad)
  std::uint32_t health = 0;
  VmState vm;
  std::uint32_t team_id = 0;

  friend bool operator==(const Tank&, const Tank&) = default;
};

// Deterministic snapshot of the whole simulation at a tick boundary.
// Sequence order is insertion order and survives serialization.
struct SimState {
  std::uint64_t time = 0; // tick counter
  std::uint64_t seed = 0;
  std::vector<Tank> tanks;
  std::vector<Bullet> bullets;

  friend bool operator==(const SimState&, const SimState&) = default;
};

// Linear search by id; first match wins.
inline std::optional<Tank> find_tank(const SimState& s, EntityId id) {
  for (const auto& t : s.tanks) {
    if (t.id == id) return t;
  }
  return std::nullopt;
}

inline std::optional<Bullet> find_bullet(const SimState& s, EntityId id) {
  for (const auto& b : s.bullets) {
    if (b.id == id) return b;
  }
  return std::nullopt;
}

} // namespace tanksim
