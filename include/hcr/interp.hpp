#pragma once
#include <cmath>
#include <hcr/geom.hpp>
#include <hcr/snapshot.hpp>

namespace hcr {

// Shortest-arc blend; result wrapped to (-pi, pi].
inline double lerp_angle_shortest(double a, double b, double t) {
  const double d = wrap_angle(b - a);
  return wrap_angle(a + d * t);
}

// Pose between two fixed steps. t is clamped to [0,1]; discrete fields
// (contact) come from the nearer side.
inline CarSnapshot interpolate(const CarSnapshot& a, const CarSnapshot& b, double t) {
  t = t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
  CarSnapshot out{};
  out.x = lerp(a.x, b.x, t);
  out.y = lerp(a.y, b.y, t);
  out.angle = lerp_angle_shortest(a.angle, b.angle, t);
  for (std::size_t i = 0; i < out.wheels.size(); ++i) {
    const auto& wa = a.wheels[i];
    const auto& wb = b.wheels[i];
    auto& w = out.wheels[i];
    w.x = lerp(wa.x, wb.x, t);
    w.y = lerp(wa.y, wb.y, t);
    w.spin = lerp_angle_shortest(wa.spin, wb.spin, t);
    w.compression = lerp(wa.compression, wb.compression, t);
    w.contact = t < 0.5 ? wa.contact : wb.contact;
  }
  return out;
}

} // namespace hcr
