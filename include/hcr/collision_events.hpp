#pragma once
#include <unordered_set>
#include <vector>
#include <hcr/car.hpp>
#include <hcr/events.hpp>
#include <hcr/physics_stepper.hpp>
#include <hcr/terrain.hpp>

namespace hcr {

struct EventParams {
  double pickup_radius = 1.5;       // m from the chassis center
  double flip_angle = kPI * 0.5;    // airborne tilt that counts as a flip
  double target_distance = 5000.0;
};

// Turns the state after a step into discrete events. Pickups it reports are
// applied to the car (coin count, fuel); everything else is only reported.
// Each coin, can and hazard fires at most once per run; Crashed and
// LevelComplete fire once; FuelEmpty fires once per transition to zero.
class CollisionEvents {
public:
  explicit CollisionEvents(const EventParams& params = {}) : params_(params) {}

  void update(CarModel& car, const TerrainGenerator& terrain, const StepReport& report,
              double elapsed, std::vector<GameEvent>& out);

  void reset();

  bool crashed() const { return crashed_; }
  bool completed() const { return completed_; }
  std::uint32_t flips() const { return flips_; }
  bool coin_taken(PickupId id) const { return coins_taken_.count(id) != 0; }
  bool can_taken(PickupId id) const { return cans_taken_.count(id) != 0; }
  const EventParams& params() const { return params_; }

private:
  void collect_pickups_(CarModel& car, const TerrainGenerator& terrain, std::vector<GameEvent>& out);

  EventParams params_;
  std::unordered_set<PickupId> coins_taken_;
  std::unordered_set<PickupId> cans_taken_;
  std::unordered_set<HazardId> hazards_seen_;
  bool crashed_{false};
  bool fuel_empty_latched_{false};
  bool completed_{false};
  std::uint32_t flips_{0};
};

} // namespace hcr
