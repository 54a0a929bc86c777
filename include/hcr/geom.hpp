#pragma once
#include <cmath>
#include <numbers>

namespace hcr {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

// World frame: x to the right (direction of travel), y up. Angles CCW positive.
struct Vec2 {
  double x{};
  double y{};

  Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
  Vec2& operator-=(const Vec2& o) { x -= o.x; y -= o.y; return *this; }
  Vec2& operator*=(double s) { x *= s; y *= s; return *this; }
};

inline Vec2 operator+(Vec2 a, const Vec2& b) { return a += b; }
inline Vec2 operator-(Vec2 a, const Vec2& b) { return a -= b; }
inline Vec2 operator*(Vec2 a, double s) { return a *= s; }
inline Vec2 operator*(double s, Vec2 a) { return a *= s; }
inline Vec2 operator-(const Vec2& a) { return {-a.x, -a.y}; }

inline double dot(const Vec2& a, const Vec2& b) { return a.x*b.x + a.y*b.y; }
// z component of the 3D cross product
inline double cross(const Vec2& a, const Vec2& b) { return a.x*b.y - a.y*b.x; }
// omega (about +z) cross r
inline Vec2 cross(double w, const Vec2& r) { return {-w * r.y, w * r.x}; }
inline double length(const Vec2& a) { return std::sqrt(dot(a, a)); }

inline Vec2 rotate(const Vec2& v, double angle_rad) {
  const double c = std::cos(angle_rad), s = std::sin(angle_rad);
  return {c*v.x - s*v.y, s*v.x + c*v.y};
}

// Wrap to (-pi, pi].
inline double wrap_angle(double a) {
  a = std::fmod(a + kPI, kTAU);
  if (a <= 0.0) a += kTAU;
  return a - kPI;
}

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

inline double smoothstep(double e0, double e1, double x) {
  if (e1 <= e0) return x < e0 ? 0.0 : 1.0;
  double t = (x - e0) / (e1 - e0);
  t = t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
  return t * t * (3.0 - 2.0 * t);
}

// Uniform Catmull–Rom (C1 continuous) on scalars, u in [0,1] between p1 and p2.
inline double catmull_rom(double p0, double p1, double p2, double p3, double u) {
  const double u2 = u*u;
  const double u3 = u2*u;
  // Basis matrix 0.5 * [ -1  3 -3  1;  2 -5  4 -1; -1  0  1  0;  0  2  0  0 ]
  const double a0 = -p0 + 3.0*p1 - 3.0*p2 + p3;
  const double a1 =  2.0*p0 - 5.0*p1 + 4.0*p2 - p3;
  const double a2 = -p0 + p2;
  const double a3 =  2.0*p1;
  return 0.5*(a0*u3 + a1*u2 + a2*u + a3);
}

// d/du of catmull_rom
inline double catmull_rom_du(double p0, double p1, double p2, double p3, double u) {
  const double a0 = -p0 + 3.0*p1 - 3.0*p2 + p3;
  const double a1 =  2.0*p0 - 5.0*p1 + 4.0*p2 - p3;
  const double a2 = -p0 + p2;
  return 0.5*(3.0*a0*u*u + 2.0*a1*u + a2);
}

} // namespace hcr
