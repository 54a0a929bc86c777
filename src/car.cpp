#include <hcr/car.hpp>
#include <algorithm>
#include <cmath>

namespace hcr {

CarModel::CarModel(const CarParams& params, const UpgradeMultipliers& upgrades)
  : params_(params),
    upgrades_(upgrades),
    wheels_{WheelModel(params.rear_offset, params.wheel, upgrades.suspension),
            WheelModel(params.front_offset, params.wheel, upgrades.suspension)} {}

void CarModel::apply_input(bool accelerate, bool brake, bool steer_left, bool steer_right) {
  input_ = DriverInput{accelerate, brake, steer_left, steer_right};
}

ChassisPose CarModel::pose() const {
  return ChassisPose{state_.position, state_.velocity, state_.angle, state_.angular_velocity};
}

Vec2 CarModel::to_world(const Vec2& local) const {
  return state_.position + rotate(local, state_.angle);
}

Vec2 CarModel::point_velocity(const Vec2& world_point) const {
  return state_.velocity + cross(state_.angular_velocity, world_point - state_.position);
}

void CarModel::apply_impulse(const Vec2& impulse, const Vec2& world_point) {
  const Vec2 r = world_point - state_.position;
  state_.velocity += impulse * (1.0 / params_.mass);
  state_.angular_velocity += cross(r, impulse) / params_.inertia;
}

bool CarModel::grounded() const {
  return wheels_[kRearWheel].state().contact || wheels_[kFrontWheel].state().contact;
}

void CarModel::place(double x, const TerrainGenerator& terrain, double gravity) {
  const auto& w = params_.wheel;
  const double sag = params_.mass * gravity / (2.0 * wheels_[kRearWheel].spring_k());
  const double ground = terrain.height_at(x);
  state_.position = {x, ground + w.rest_length - sag + w.radius - params_.rear_offset.y};
  state_.velocity = {};
  state_.angle = 0.0;
  state_.angular_velocity = 0.0;
  body_contact_ = false;
  for (auto& wheel : wheels_) wheel.resolve(pose(), 0.0, terrain);
}

double CarModel::traction_limit_(const WheelModel& w) const {
  return w.params().grip * upgrades_.traction * w.state().load;
}

Vec2 CarModel::contact_tangent(const std::array<WheelContact, 2>& contacts,
                               const TerrainGenerator& terrain) const {
  Vec2 t{};
  for (std::size_t i = 0; i < contacts.size(); ++i) {
    if (contacts[i].contact) t += terrain.tangent_at(wheels_[i].state().contact_point.x);
  }
  const double len = length(t);
  if (len <= 0.0) return {std::cos(state_.angle), std::sin(state_.angle)};
  return t * (1.0 / len);
}

double CarModel::drive(const std::array<WheelContact, 2>& contacts, const TerrainGenerator& terrain,
                       double dt, Vec2& force, double& torque) {
  for (auto& w : wheels_) w.set_slipping(false);
  if (!input_.accelerate) return 0.0;
  if (state_.fuel <= 0.0) {
    state_.fuel = 0.0;
    return 0.0;
  }

  const double burn = std::min(state_.fuel,
      params_.fuel_burn_rate * dt / upgrades_.fuel_efficiency);
  state_.fuel = std::clamp(state_.fuel - burn, 0.0, 100.0);

  const Vec2 t_avg = contact_tangent(contacts, terrain);
  const double v_t = dot(state_.velocity, t_avg);
  const double taper = std::clamp(1.0 - v_t / top_speed(), 0.0, 1.0);
  const double per_wheel = 0.5 * params_.mass * params_.engine_accel * upgrades_.acceleration * taper;

  for (std::size_t i = 0; i < contacts.size(); ++i) {
    if (!contacts[i].contact) continue;
    auto& w = wheels_[i];
    const double limit = traction_limit_(w);
    double f = per_wheel;
    if (f > limit) {
      f = limit;
      w.set_slipping(true);
    }
    const Vec2 t = terrain.tangent_at(w.state().contact_point.x);
    const Vec2 F = t * f;
    force += F;
    torque += cross(contacts[i].attach - state_.position, F);
  }
  return burn;
}

void CarModel::brake(const std::array<WheelContact, 2>& contacts, const TerrainGenerator& terrain, double dt) {
  if (!input_.brake) return;
  double dv_max = 0.0;
  for (std::size_t i = 0; i < contacts.size(); ++i) {
    if (!contacts[i].contact) continue;
    const double by_brake = 0.5 * params_.brake_decel * dt;
    const double by_grip = traction_limit_(wheels_[i]) / params_.mass * dt;
    dv_max += std::min(by_brake, by_grip);
  }
  if (dv_max <= 0.0) return;

  const Vec2 t = contact_tangent(contacts, terrain);
  const double v_t = dot(state_.velocity, t);
  const double dv = std::min(std::abs(v_t), dv_max);
  state_.velocity -= t * std::copysign(dv, v_t);
}

void CarModel::air_steer(double dt) {
  if (supported()) return;
  double dir = 0.0;
  if (input_.steer_left)  dir += 1.0;
  if (input_.steer_right) dir -= 1.0;
  state_.angular_velocity += dir * params_.air_steer_accel * dt;
}

} // namespace hcr
