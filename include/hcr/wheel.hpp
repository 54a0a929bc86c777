#pragma once
#include <hcr/geom.hpp>
#include <hcr/terrain.hpp>

namespace hcr {

struct WheelParams {
  double radius = 0.4;        // m
  double rest_length = 0.5;   // suspension travel, m
  double spring_k = 50.0;     // per wheel, per unit chassis mass
  double damping = 7.0;
  double grip = 1.2;          // tire friction coefficient before traction upgrades
};

// Chassis rigid-body state the wheels are resolved against.
struct ChassisPose {
  Vec2 position{};
  Vec2 velocity{};
  double angle = 0.0;
  double angular_velocity = 0.0;
};

struct WheelState {
  Vec2 offset{};              // attachment point in the chassis frame
  double compression = 0.0;   // 0 = fully extended, 1 = fully compressed
  bool contact = false;
  Vec2 normal{0.0, 1.0};      // surface normal under the wheel
  Vec2 contact_point{};       // ground point below the wheel (world)
  Vec2 center{};              // wheel hub (world)
  double load = 0.0;          // suspension force magnitude
  bool hard_hit = false;
  bool slipping = false;
  double spin = 0.0;          // rolling angle, rendering only
};

// Result of one resolve() call. Force and torque act on the chassis.
struct WheelContact {
  Vec2 force{};
  double torque = 0.0;
  bool contact = false;
  Vec2 normal{0.0, 1.0};
  Vec2 attach{};              // world attachment point
  bool hard_hit = false;      // raw compression beyond full travel
  double impact_speed = 0.0;  // compression rate at a hard hit, m/s
  double penetration = 0.0;   // m beyond full travel
};

class WheelModel {
public:
  WheelModel(Vec2 offset, const WheelParams& params, double suspension_mult = 1.0);

  // Probes along the chassis-local down vector. Airborne wheels return a
  // zero force; a probe pointing away from the ground counts as airborne.
  WheelContact resolve(const ChassisPose& pose, double dt, const TerrainGenerator& terrain);

  Vec2 attachment(const ChassisPose& pose) const;
  double spring_k() const { return params_.spring_k * suspension_mult_; }

  void set_slipping(bool s) { state_.slipping = s; }

  const WheelState& state() const { return state_; }
  const WheelParams& params() const { return params_; }

private:
  void go_airborne_(const Vec2& attach, const Vec2& down);

  WheelParams params_;
  double suspension_mult_;
  WheelState state_;
};

} // namespace hcr
