#include <hcr/wheel.hpp>
#include <algorithm>
#include <cmath>

namespace hcr {

namespace {

// Below this, the down vector is too close to horizontal to reach the ground.
constexpr double kMinDownY = -0.2;
constexpr int kRayIterations = 3;

} // namespace

WheelModel::WheelModel(Vec2 offset, const WheelParams& params, double suspension_mult)
  : params_(params), suspension_mult_(suspension_mult) {
  state_.offset = offset;
}

Vec2 WheelModel::attachment(const ChassisPose& pose) const {
  return pose.position + rotate(state_.offset, pose.angle);
}

void WheelModel::go_airborne_(const Vec2& attach, const Vec2& down) {
  state_.compression = 0.0;
  state_.contact = false;
  state_.normal = {0.0, 1.0};
  state_.load = 0.0;
  state_.hard_hit = false;
  state_.slipping = false;
  state_.center = attach + down * params_.rest_length;
  state_.contact_point = state_.center + down * params_.radius;
}

WheelContact WheelModel::resolve(const ChassisPose& pose, double dt, const TerrainGenerator& terrain) {
  WheelContact out{};
  const Vec2 r = rotate(state_.offset, pose.angle);
  const Vec2 attach = pose.position + r;
  const Vec2 down{std::sin(pose.angle), -std::cos(pose.angle)};
  out.attach = attach;

  if (down.y > kMinDownY) {
    go_airborne_(attach, down);
    return out;
  }

  // Ray/ground intersection: fixed-point on the distance along down.
  double t = (attach.y - terrain.height_at(attach.x)) / -down.y;
  for (int i = 0; i < kRayIterations; ++i) {
    t = (attach.y - terrain.height_at(attach.x + down.x * t)) / -down.y;
  }

  const double rest = params_.rest_length;
  const double probe = t - params_.radius;
  if (probe >= rest) {
    go_airborne_(attach, down);
    return out;
  }

  const double compression_m = rest - probe;
  const double raw = compression_m / rest;
  const Vec2 ground = attach + down * t;
  const Vec2 n = terrain.normal_at(ground.x);

  const Vec2 v_point = pose.velocity + cross(pose.angular_velocity, r);
  const double rate = -dot(v_point, n);  // > 0 while compressing

  const double spring = spring_k() * std::min(compression_m, rest);
  const double mag = std::max(0.0, spring + params_.damping * rate);
  const Vec2 f = n * mag;

  out.force = f;
  out.torque = cross(r, f);
  out.contact = true;
  out.normal = n;
  if (raw > 1.0) {
    out.hard_hit = true;
    out.impact_speed = std::max(0.0, rate);
    out.penetration = compression_m - rest;
  }

  state_.compression = std::clamp(raw, 0.0, 1.0);
  state_.contact = true;
  state_.normal = n;
  state_.contact_point = ground;
  state_.center = attach + down * std::clamp(probe, 0.0, rest);
  state_.load = mag;
  state_.hard_hit = out.hard_hit;

  const Vec2 tangent{n.y, -n.x};
  state_.spin -= dot(v_point, tangent) * dt / params_.radius;
  state_.spin = std::remainder(state_.spin, kTAU);
  return out;
}

} // namespace hcr
