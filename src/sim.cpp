#include <tanksim/sim.hpp>
#include <tanksim/log.hpp>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace tanksim {

SimServer::SimServer(const ArenaConfig& config)
  : config_(config),
    grid_(config.map_width, config.map_height, config.grid_width, config.grid_height) {
  log_debug(kLogSim, "server ready, map " + config.map_width.to_string() + "x" + config.map_height.to_string());
}

void SimServer::load(SimState state) {
  state_ = std::move(state);
  grid_.clear();
  broad_ = BroadPhase{};
  log_debug(kLogSim, "loaded snapshot at tick " + std::to_string(state_.time) + " with " +
                         std::to_string(state_.tanks.size()) + " tanks, " +
                         std::to_string(state_.bullets.size()) + " bullets");
}

void SimServer::clear_entities() {
  state_.tanks.clear();
  state_.bullets.clear();
}

void SimServer::add_tank(const Tank& tank) { state_.tanks.push_back(tank); }

void SimServer::add_bullet(const Bullet& bullet) { state_.bullets.push_back(bullet); }

bool SimServer::remove_tank(EntityId id) {
  auto it = std::find_if(state_.tanks.begin(), state_.tanks.end(), [&](const Tank& t){ return t.id == id; });
  if (it == state_.tanks.end()) return false;
  state_.tanks.erase(it);
  return true;
}

bool SimServer::remove_bullet(EntityId id) {
  auto it = std::find_if(state_.bullets.begin(), state_.bullets.end(), [&](const Bullet& b){ return b.id == id; });
  if (it == state_.bullets.end()) return false;
  state_.bullets.erase(it);
  return true;
}

const Tank* SimServer::tank_by_index(std::size_t idx) const {
  if (idx >= state_.tanks.size()) return nullptr;
  return &state_.tanks[idx];
}
Tank* SimServer::tank_by_index(std::size_t idx) {
  if (idx >= state_.tanks.size()) return nullptr;
  return &state_.tanks[idx];
}

const Tank* SimServer::tank_by_id(EntityId id) const {
  for (const auto& t : state_.tanks) if (t.id == id) return &t;
  return nullptr;
}
Tank* SimServer::tank_by_id(EntityId id) {
  for (auto& t : state_.tanks) if (t.id == id) return &t;
  return nullptr;
}

const Bullet* SimServer::bullet_by_id(EntityId id) const {
  for (const auto& b : state_.bullets) if (b.id == id) return &b;
  return nullptr;
}
Bullet* SimServer::bullet_by_id(EntityId id) {
  for (auto& b : state_.bullets) if (b.id == id) return &b;
  return nullptr;
}

const BroadPhase& SimServer::step() {
  // Everything that can throw runs on copies; state_ is only touched once the
  // whole tick has been computed.
  std::vector<Tank> tanks = state_.tanks;
  std::vector<Bullet> bullets = state_.bullets;
  for (auto& t : tanks) t.position = t.position + t.velocity;
  for (auto& b : bullets) b.position = b.position + b.velocity;

  std::vector<AABB> tank_boxes;
  tank_boxes.reserve(tanks.size());
  for (const auto& t : tanks) tank_boxes.push_back(tank_bounds(t));
  std::vector<AABB> bullet_boxes;
  bullet_boxes.reserve(bullets.size());
  for (const auto& b : bullets) bullet_boxes.push_back(bullet_bounds(b));

  BroadPhase next;
  next.tank_pairs.reserve(broad_.tank_pairs.size());
  next.bullet_hits.reserve(broad_.bullet_hits.size());

  state_.tanks.swap(tanks);
  state_.bullets.swap(bullets);
  rebuild_grid_(tank_boxes);
  collect_candidates_(tank_boxes, bullet_boxes, next);
  broad_ = std::move(next);
  ++state_.time;
  return broad_;
}

void SimServer::rebuild_grid_(const std::vector<AABB>& tank_boxes) {
  grid_.clear();
  for (std::size_t i = 0; i < state_.tanks.size(); ++i) grid_.insert(state_.tanks[i].id, tank_boxes[i]);
}

void SimServer::collect_candidates_(const std::vector<AABB>& tank_boxes, const std::vector<AABB>& bullet_boxes,
                                    BroadPhase& out) const {
  for (std::size_t i = 0; i < state_.tanks.size(); ++i) {
    const EntityId id = state_.tanks[i].id;
    for (ObjectId other : grid_.query(tank_boxes[i])) {
      if (other > id) out.tank_pairs.emplace_back(id, other);
    }
  }
  for (std::size_t i = 0; i < state_.bullets.size(); ++i) {
    for (ObjectId tank : grid_.query(bullet_boxes[i])) {
      out.bullet_hits.emplace_back(state_.bullets[i].id, tank);
    }
  }

  // Duplicate ids among tanks would repeat pairs.
  std::sort(out.tank_pairs.begin(), out.tank_pairs.end());
  out.tank_pairs.erase(std::unique(out.tank_pairs.begin(), out.tank_pairs.end()), out.tank_pairs.end());
  std::sort(out.bullet_hits.begin(), out.bullet_hits.end());
  out.bullet_hits.erase(std::unique(out.bullet_hits.begin(), out.bullet_hits.end()), out.bullet_hits.end());
}

} // namespace tanksim
