#include <hcr/collision_events.hpp>
#include <algorithm>
#include <cmath>

namespace hcr {

void CollisionEvents::reset() {
  coins_taken_.clear();
  cans_taken_.clear();
  hazards_seen_.clear();
  crashed_ = false;
  fuel_empty_latched_ = false;
  completed_ = false;
  flips_ = 0;
}

void CollisionEvents::collect_pickups_(CarModel& car, const TerrainGenerator& terrain,
                                       std::vector<GameEvent>& out) {
  auto& s = car.state();
  const double r = params_.pickup_radius;
  const double r2 = r * r;

  for (const auto& c : terrain.coins_between(s.position.x - r, s.position.x + r)) {
    const Vec2 d = c.position - s.position;
    if (dot(d, d) > r2) continue;
    if (!coins_taken_.insert(c.id).second) continue;
    ++s.coins_collected;
    out.emplace_back(CoinCollected{c.id});
  }

  for (const auto& f : terrain.fuel_cans_between(s.position.x - r, s.position.x + r)) {
    const Vec2 d = f.position - s.position;
    if (dot(d, d) > r2) continue;
    if (!cans_taken_.insert(f.id).second) continue;
    s.fuel = std::clamp(s.fuel + f.amount, 0.0, 100.0);
    out.emplace_back(FuelCollected{f.id, f.amount});
  }
}

void CollisionEvents::update(CarModel& car, const TerrainGenerator& terrain, const StepReport& report,
                             double elapsed, std::vector<GameEvent>& out) {
  auto& s = car.state();

  if (report.crash_impact) s.health = 0.0;
  if (!crashed_ && s.health <= 0.0) {
    crashed_ = true;
    out.emplace_back(Crashed{});
  }

  if (report.landing && report.landing->clean && report.landing->peak_tilt > params_.flip_angle && !crashed_) {
    ++flips_;
    out.emplace_back(Flipped{report.landing->airtime});
  }

  for (const auto& h : report.hazards) {
    if (hazards_seen_.insert(h.id).second) out.emplace_back(HazardTriggered{h.id, h.kind});
  }

  collect_pickups_(car, terrain, out);

  // Re-armed by refuelling.
  if (s.fuel <= 0.0) {
    s.fuel = 0.0;
    s.fuel_empty = true;
    if (!fuel_empty_latched_) {
      fuel_empty_latched_ = true;
      out.emplace_back(FuelEmpty{});
    }
  } else {
    s.fuel_empty = false;
    fuel_empty_latched_ = false;
  }

  if (!completed_ && s.distance >= params_.target_distance) {
    completed_ = true;
    out.emplace_back(LevelComplete{s.distance, s.coins_collected, elapsed});
  }
}

} // namespace hcr
