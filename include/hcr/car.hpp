#pragma once
#include <array>
#include <cstdint>
#include <hcr/geom.hpp>
#include <hcr/upgrades.hpp>
#include <hcr/wheel.hpp>

namespace hcr {

// Boolean level-state intents, sampled once per fixed step.
struct DriverInput {
  bool accelerate = false;
  bool brake = false;
  bool steer_left = false;   // counter-clockwise (lean back)
  bool steer_right = false;  // clockwise (lean forward)
};

struct CarState {
  Vec2 position{};            // chassis center, world (m)
  Vec2 velocity{};            // m/s
  double angle = 0.0;         // rad, CCW, wrapped to (-pi, pi]
  double angular_velocity = 0.0;
  double health = 100.0;      // [0,100]
  double fuel = 100.0;        // [0,100]
  double distance = 0.0;      // forward progress (m), non-decreasing
  std::uint32_t coins_collected = 0;
  bool fuel_empty = false;
};

struct CarParams {
  double mass = 1.0;          // normalized
  double inertia = 0.55;
  double half_length = 1.3;   // chassis box
  double half_height = 0.35;
  double roof_height = 0.85;  // cabin roof above the center
  Vec2 rear_offset{-1.0, -0.25};
  Vec2 front_offset{1.0, -0.25};
  WheelParams wheel{};

  double engine_accel = 12.0;     // m/s^2 at standstill
  double top_speed = 20.0;        // engine output tapers to zero here
  double brake_decel = 14.0;      // m/s^2
  double air_steer_accel = 7.0;   // rad/s^2
  double fuel_burn_rate = 1.5;    // units per second at full throttle
};

enum WheelIndex : std::size_t { kRearWheel = 0, kFrontWheel = 1 };

class CarModel {
public:
  CarModel(const CarParams& params, const UpgradeMultipliers& upgrades);

  void apply_input(bool accelerate, bool brake, bool steer_left, bool steer_right);
  void apply_input(const DriverInput& in) { input_ = in; }
  const DriverInput& input() const { return input_; }

  const CarState& state() const { return state_; }
  CarState& state() { return state_; }

  std::array<WheelModel, 2>& wheels() { return wheels_; }
  const std::array<WheelModel, 2>& wheels() const { return wheels_; }

  const CarParams& params() const { return params_; }
  const UpgradeMultipliers& upgrades() const { return upgrades_; }

  ChassisPose pose() const;
  Vec2 to_world(const Vec2& local) const;
  Vec2 point_velocity(const Vec2& world_point) const;
  void apply_impulse(const Vec2& impulse, const Vec2& world_point);

  double speed() const { return length(state_.velocity); }
  bool grounded() const;
  // Wheels on the ground, or the chassis resting on it since the last step.
  bool supported() const { return grounded() || body_contact_; }
  void set_body_contact(bool touching) { body_contact_ = touching; }
  double top_speed() const { return params_.top_speed * upgrades_.top_speed; }

  // Places the chassis at x with both wheels at their static compression.
  void place(double x, const TerrainGenerator& terrain, double gravity);

  // Engine force through the contacting wheels; burns fuel. Accumulates into
  // force/torque. Returns the fuel burned.
  double drive(const std::array<WheelContact, 2>& contacts, const TerrainGenerator& terrain,
               double dt, Vec2& force, double& torque);
  // Tangential velocity change opposing motion, clamped at the zero crossing.
  void brake(const std::array<WheelContact, 2>& contacts, const TerrainGenerator& terrain, double dt);
  void air_steer(double dt);

  // Average surface tangent under the contacting wheels.
  Vec2 contact_tangent(const std::array<WheelContact, 2>& contacts, const TerrainGenerator& terrain) const;

private:
  double traction_limit_(const WheelModel& w) const;

  CarParams params_;
  UpgradeMultipliers upgrades_;
  CarState state_;
  DriverInput input_;
  std::array<WheelModel, 2> wheels_;
  bool body_contact_{false};
};

} // namespace hcr
