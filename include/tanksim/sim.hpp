#pragma once
#include <cstddef>
#include <utility>
#include <vector>
#include <tanksim/aabb.hpp>
#include <tanksim/config.hpp>
#include <tanksim/spatial.hpp>
#include <tanksim/state.hpp>

namespace tanksim {

using IdPair = std::pair<EntityId, EntityId>;

// Candidates from the last tick's grid. Over-inclusive: sharing a cell is
// enough. Narrow-phase tests and responses are up to the caller.
struct BroadPhase {
  std::vector<IdPair> tank_pairs;  // (a, b) with a < b, sorted
  std::vector<IdPair> bullet_hits; // (bullet id, tank id), sorted

  friend bool operator==(const BroadPhase&, const BroadPhase&) = default;
};

// Authoritative tick driver for one simulation replica. Owns the state
// snapshot and the spatial grid; nothing is shared between instances.
class SimServer {
public:
  explicit SimServer(const ArenaConfig& config = {});

  const ArenaConfig& config() const { return config_; }
  const SimState& state() const { return state_; }
  const SpatialHashMap& grid() const { return grid_; }
  const BroadPhase& broad_phase() const { return broad_; }

  // Replaces the snapshot. Grid and candidates refresh on the next step().
  void load(SimState state);

  // --- Entity management (insertion order is kept)
  void clear_entities();
  void add_tank(const Tank& tank);
  void add_bullet(const Bullet& bullet);
  bool remove_tank(EntityId id);
  bool remove_bullet(EntityId id);
  std::size_t tank_count() const { return state_.tanks.size(); }
  std::size_t bullet_count() const { return state_.bullets.size(); }

  // Access by index (0..N-1). Returns nullptr if out of range.
  const Tank* tank_by_index(std::size_t idx) const;
  Tank*       tank_by_index(std::size_t idx);

  // Access by id (linear search). Returns nullptr if absent.
  const Tank*   tank_by_id(EntityId id) const;
  Tank*         tank_by_id(EntityId id);
  const Bullet* bullet_by_id(EntityId id) const;
  Bullet*       bullet_by_id(EntityId id);

  AABB tank_bounds(const Tank& tank) const { return AABB::from_size(tank.position, config_.tank_size); }
  AABB bullet_bounds(const Bullet& bullet) const { return AABB::from_size(bullet.position, config_.bullet_size); }

  // --- Simulation
  // One tick: move every entity by its velocity, rebuild the grid from the
  // tank boxes, collect candidates, advance time. All or nothing: if a
  // position or box overflows, ArithmeticError propagates and state, grid and
  // candidates are left as they were.
  const BroadPhase& step();

private:
  void rebuild_grid_(const std::vector<AABB>& tank_boxes);
  void collect_candidates_(const std::vector<AABB>& tank_boxes, const std::vector<AABB>& bullet_boxes,
                           BroadPhase& out) const;

  ArenaConfig config_;
  SimState state_;
  SpatialHashMap grid_;
  BroadPhase broad_;
};

} // namespace tanksim
