#include <hcr/physics_stepper.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace hcr {

namespace {

constexpr double kRolloverAngle = kPI * 0.5;
constexpr double kCriticalRollAngle = kPI * 0.75;

} // namespace

StepperParams stepper_params_for(const LevelParams& level) {
  StepperParams p{};
  p.gravity = 9.81 * level.gravity_scale;
  p.friction_coefficient = level.friction_coefficient;
  p.air_resistance = level.air_resistance;
  return p;
}

PhysicsStepper::PhysicsStepper(const StepperParams& params) : params_(params) {}

int PhysicsStepper::schedule(double frame_dt) {
  if (!(frame_dt > 0.0) || params_.dt <= 0.0) return 0;
  accumulator_ += frame_dt;
  int n = static_cast<int>(accumulator_ / params_.dt);
  if (n > params_.max_substeps) {
    n = params_.max_substeps;
    accumulator_ = std::fmod(accumulator_, params_.dt);
  } else {
    accumulator_ -= n * params_.dt;
  }
  if (accumulator_ < 0.0) accumulator_ = 0.0;
  return n;
}

void PhysicsStepper::reset(double start_x) {
  accumulator_ = 0.0;
  steps_ = 0;
  furthest_x_ = start_x;
  airborne_ = false;
  airtime_ = 0.0;
  peak_tilt_ = 0.0;
  rollover_cooldown_ = 0.0;
  used_boosts_.clear();
}

StepReport PhysicsStepper::step(CarModel& car, TerrainGenerator& terrain) {
  StepReport rep{};
  const double dt = params_.dt;
  auto& s = car.state();
  const auto& cp = car.params();

  // Bounded look-ahead; anything further is generated on demand by the queries.
  terrain.prefetch(s.position.x + params_.prefetch_ahead, params_.prefetch_chunks_per_step);

  // Wheels see the start-of-step state.
  const ChassisPose pose = car.pose();

  // 1. gravity
  s.velocity.y -= params_.gravity * dt;

  // 2. wheel contacts, engine, brake, air steering
  Vec2 force{};
  double torque = 0.0;
  auto& wheels = car.wheels();
  for (std::size_t i = 0; i < wheels.size(); ++i) {
    rep.wheels[i] = wheels[i].resolve(pose, dt, terrain);
    force += rep.wheels[i].force;
    torque += rep.wheels[i].torque;
    if (rep.wheels[i].hard_hit) {
      rep.hard_hit = true;
      rep.impact_speed = std::max(rep.impact_speed, rep.wheels[i].impact_speed);
    }
  }
  rep.grounded = car.grounded();
  rep.fuel_burned = car.drive(rep.wheels, terrain, dt, force, torque);
  s.velocity += force * (dt / cp.mass);
  s.angular_velocity += torque * dt / cp.inertia;
  car.brake(rep.wheels, terrain, dt);
  car.air_steer(dt);

  // 3. air resistance
  s.velocity -= s.velocity * (params_.air_resistance * 0.5 * dt);
  s.angular_velocity -= s.angular_velocity * (params_.air_resistance * 2.0 * dt);

  // 4. ground friction
  if (rep.grounded) apply_friction_(car, rep, terrain);

  // 5. integrate, then push out of the ground
  s.position += s.velocity * dt;
  s.angle = wrap_angle(s.angle + s.angular_velocity * dt);
  resolve_bottom_out_(car, terrain, rep);
  resolve_body_(car, terrain, rep);
  car.set_body_contact(rep.body_contact);
  rep.supported = rep.grounded || rep.body_contact;
  if (s.position.x < cp.half_length) {
    s.position.x = cp.half_length;
    if (s.velocity.x < 0.0) s.velocity.x = 0.0;
  }

  // 6. distance: forward progress only
  if (s.position.x > furthest_x_) {
    s.distance += s.position.x - furthest_x_;
    furthest_x_ = s.position.x;
  }

  // 7. damage
  track_airborne_(car, terrain, rep);
  touch_hazards_(car, terrain, rep);
  apply_damage_(car, rep);

  ++steps_;
  return rep;
}

void PhysicsStepper::apply_friction_(CarModel& car, const StepReport& rep, const TerrainGenerator& terrain) const {
  auto& s = car.state();
  const Vec2 t = car.contact_tangent(rep.wheels, terrain);
  const double v_t = dot(s.velocity, t);
  const double decel = params_.friction_coefficient * (0.6 * std::abs(v_t) + 0.3);
  const double dv = std::min(std::abs(v_t), decel * params_.dt);
  s.velocity -= t * std::copysign(dv, v_t);
}

bool PhysicsStepper::resolve_point_(CarModel& car, const Vec2& p, const TerrainGenerator& terrain,
                                    double& impact_speed) const {
  const double h = terrain.height_at(p.x);
  if (p.y >= h) return false;

  auto& s = car.state();
  const auto& cp = car.params();
  const Vec2 n = terrain.normal_at(p.x);
  const Vec2 r = p - s.position;
  const double vn = dot(car.point_velocity(p), n);

  if (vn < 0.0) {
    // Inelastic normal impulse, then Coulomb-limited scrape.
    const double rn = cross(r, n);
    const double j = -vn / (1.0 / cp.mass + rn * rn / cp.inertia);
    car.apply_impulse(n * j, p);

    const Vec2 t{n.y, -n.x};
    const double vt = dot(car.point_velocity(p), t);
    const double rt = cross(r, t);
    const double jt_max = params_.scrape_friction * j;
    const double jt = std::clamp(-vt / (1.0 / cp.mass + rt * rt / cp.inertia), -jt_max, jt_max);
    car.apply_impulse(t * jt, p);

    impact_speed = std::max(impact_speed, -vn);
  }
  s.position += n * ((h - p.y) * n.y);
  return true;
}

void PhysicsStepper::resolve_bottom_out_(CarModel& car, const TerrainGenerator& terrain, StepReport& rep) {
  // At full travel the tire bottom sits at attach + down * radius.
  for (const auto& w : car.wheels()) {
    const auto& s = car.state();
    const Vec2 down{std::sin(s.angle), -std::cos(s.angle)};
    const Vec2 p = car.to_world(w.state().offset) + down * w.params().radius;
    double impact = 0.0;
    if (resolve_point_(car, p, terrain, impact)) {
      rep.hard_hit = true;
      rep.impact_speed = std::max(rep.impact_speed, impact);
    }
  }
}

void PhysicsStepper::resolve_body_(CarModel& car, const TerrainGenerator& terrain, StepReport& rep) {
  const auto& cp = car.params();
  const Vec2 hull[] = {
    {-cp.half_length, -cp.half_height}, { cp.half_length, -cp.half_height},
    {-cp.half_length,  cp.half_height}, { cp.half_length,  cp.half_height},
    {0.0, cp.roof_height},
  };
  for (std::size_t i = 0; i < std::size(hull); ++i) {
    double impact = 0.0;
    if (!resolve_point_(car, car.to_world(hull[i]), terrain, impact)) continue;
    rep.body_contact = true;
    rep.body_impact_speed = std::max(rep.body_impact_speed, impact);
    if (hull[i].y > 0.0) rep.roof_contact = true;
  }
}

void PhysicsStepper::track_airborne_(const CarModel& car, const TerrainGenerator& terrain, StepReport& rep) {
  const auto& s = car.state();
  if (!rep.supported) {
    if (!airborne_) {
      airborne_ = true;
      airtime_ = 0.0;
      peak_tilt_ = 0.0;
    }
    airtime_ += params_.dt;
    peak_tilt_ = std::max(peak_tilt_, std::abs(s.angle));
    return;
  }
  if (!airborne_) return;

  Landing l{};
  l.peak_tilt = peak_tilt_;
  l.relative_angle = std::abs(wrap_angle(s.angle - terrain.slope_at(s.position.x)));
  l.angular_rate = std::abs(s.angular_velocity);
  l.airtime = airtime_;
  l.clean = l.relative_angle <= params_.landing_tolerance && l.angular_rate <= params_.landing_rate_limit;
  rep.landing = l;
  airborne_ = false;
}

void PhysicsStepper::touch_hazards_(CarModel& car, const TerrainGenerator& terrain, StepReport& rep) {
  auto& s = car.state();
  const auto& wheels = car.wheels();
  for (std::size_t i = 0; i < wheels.size(); ++i) {
    if (!rep.wheels[i].contact) continue;
    const auto hz = terrain.hazard_at(wheels[i].state().contact_point.x);
    if (!hz) continue;
    const bool seen = std::any_of(rep.hazards.begin(), rep.hazards.end(),
                                  [&](const Hazard& h){ return h.id == hz->id; });
    if (seen) continue;
    rep.hazards.push_back(*hz);

    if (hz->kind == HazardKind::Boost && used_boosts_.insert(hz->id).second) {
      s.velocity += terrain.tangent_at(s.position.x) * params_.boost_dv;
    }
  }
}

void PhysicsStepper::apply_damage_(CarModel& car, StepReport& rep) {
  auto& s = car.state();
  double dmg = 0.0;

  if (rep.hard_hit) {
    if (rep.impact_speed > params_.crash_impact_speed) {
      rep.crash_impact = true;
    } else if (rep.impact_speed > params_.hard_hit_speed) {
      dmg += (rep.impact_speed - params_.hard_hit_speed) * params_.hard_hit_damage;
    }
  }
  if (rep.body_impact_speed > params_.body_impact_speed) {
    dmg += (rep.body_impact_speed - params_.body_impact_speed) * params_.body_impact_damage;
  }

  if (rollover_cooldown_ > 0.0) rollover_cooldown_ = std::max(0.0, rollover_cooldown_ - params_.dt);
  const double tilt = std::abs(s.angle);
  if (rep.roof_contact && tilt > kRolloverAngle && rollover_cooldown_ <= 0.0) {
    if (tilt < kCriticalRollAngle) {
      dmg += std::min(20.0, tilt * 5.0);
      rollover_cooldown_ = 0.5;
    } else {
      dmg += std::min(60.0, tilt * 20.0);
      rollover_cooldown_ = 1.0;
    }
  }

  if (rep.landing && rep.landing->angular_rate > params_.landing_rate_limit) {
    dmg += (rep.landing->angular_rate - params_.landing_rate_limit) * params_.landing_rate_damage;
  }

  const bool on_spikes = std::any_of(rep.hazards.begin(), rep.hazards.end(),
                                     [](const Hazard& h){ return h.kind == HazardKind::Spikes; });
  if (on_spikes) dmg += params_.spike_damage_rate * params_.dt;

  rep.damage = dmg;
  if (rep.crash_impact) {
    rep.damage = s.health;
    s.health = 0.0;
    return;
  }
  s.health = std::clamp(s.health - dmg, 0.0, 100.0);
}

} // namespace hcr
