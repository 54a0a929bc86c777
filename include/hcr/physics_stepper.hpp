#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>
#include <hcr/car.hpp>
#include <hcr/level.hpp>
#include <hcr/terrain.hpp>

namespace hcr {

struct StepperParams {
  double dt = 1.0 / 60.0;
  int max_substeps = 5;
  double gravity = 9.81;              // already scaled by the level
  double friction_coefficient = 0.6;
  double air_resistance = 0.1;

  double prefetch_ahead = 240.0;      // m of terrain kept ready ahead of the car
  std::size_t prefetch_chunks_per_step = 1;

  double scrape_friction = 0.5;       // chassis sliding on the ground

  // Landing classification
  double landing_tolerance = 0.70;    // rad between chassis and surface (40 deg)
  double landing_rate_limit = 5.0;    // rad/s

  // Damage
  double hard_hit_speed = 8.0;        // m/s compression rate before damage
  double hard_hit_damage = 6.0;       // per m/s above hard_hit_speed
  double crash_impact_speed = 18.0;   // bottom-out at this speed zeroes health
  double body_impact_speed = 6.0;
  double body_impact_damage = 4.0;
  double landing_rate_damage = 8.0;   // per rad/s above landing_rate_limit
  double spike_damage_rate = 25.0;    // per second on spikes
  double boost_dv = 6.0;              // m/s along the surface, once per pad
};

StepperParams stepper_params_for(const LevelParams& level);

struct Landing {
  double peak_tilt = 0.0;       // largest |angle| while airborne
  double relative_angle = 0.0;  // |chassis - surface| at recontact
  double angular_rate = 0.0;
  double airtime = 0.0;
  bool clean = false;
};

struct StepReport {
  std::array<WheelContact, 2> wheels{};
  bool grounded = false;         // a wheel touches the ground
  bool supported = false;        // grounded, or the chassis lies on the ground
  bool hard_hit = false;
  double impact_speed = 0.0;
  bool crash_impact = false;
  bool body_contact = false;
  double body_impact_speed = 0.0;
  bool roof_contact = false;
  std::optional<Landing> landing;
  std::vector<Hazard> hazards;  // touched by a contacting wheel this step
  double damage = 0.0;
  double fuel_burned = 0.0;
};

// Advances one car over the terrain in fixed steps. Per step, in this order:
// gravity, wheel forces with drive/brake/air steering, drag, ground friction,
// semi-implicit Euler with collision resolution, distance, damage.
class PhysicsStepper {
public:
  explicit PhysicsStepper(const StepperParams& params = {});

  // Adds real frame time; returns the number of fixed steps due (<= max_substeps).
  // Time beyond the cap is dropped.
  int schedule(double frame_dt);
  double alpha() const { return params_.dt > 0.0 ? accumulator_ / params_.dt : 0.0; }

  StepReport step(CarModel& car, TerrainGenerator& terrain);

  void reset(double start_x);

  const StepperParams& params() const { return params_; }
  double furthest_x() const { return furthest_x_; }
  bool airborne() const { return airborne_; }
  double airtime() const { return airtime_; }
  std::uint64_t steps() const { return steps_; }

private:
  void apply_friction_(CarModel& car, const StepReport& rep, const TerrainGenerator& terrain) const;
  void resolve_body_(CarModel& car, const TerrainGenerator& terrain, StepReport& rep);
  void resolve_bottom_out_(CarModel& car, const TerrainGenerator& terrain, StepReport& rep);
  void track_airborne_(const CarModel& car, const TerrainGenerator& terrain, StepReport& rep);
  void touch_hazards_(CarModel& car, const TerrainGenerator& terrain, StepReport& rep);
  void apply_damage_(CarModel& car, StepReport& rep);
  bool resolve_point_(CarModel& car, const Vec2& world_point, const TerrainGenerator& terrain,
                      double& impact_speed) const;

  StepperParams params_;
  double accumulator_{0.0};
  std::uint64_t steps_{0};

  double furthest_x_{0.0};
  bool airborne_{false};
  double airtime_{0.0};
  double peak_tilt_{0.0};
  double rollover_cooldown_{0.0};
  std::unordered_set<HazardId> used_boosts_;
};

} // namespace hcr
