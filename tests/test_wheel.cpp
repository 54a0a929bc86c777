#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <hcr/terrain.hpp>
#include <hcr/wheel.hpp>

using Catch::Approx;
using namespace hcr;

namespace {

constexpr double kDt = 1.0 / 60.0;
constexpr double kG = 9.81;

// Chassis height at which a wheel hanging 0.25 m below the center carries m*g/2.
double static_height(const WheelParams& w, double suspension_mult = 1.0) {
  return w.rest_length - kG / (2.0 * w.spring_k * suspension_mult) + w.radius + 0.25;
}

} // namespace

TEST_CASE("Wheel far above the ground is airborne with no force") {
  TerrainGenerator terrain(42, DifficultyTier::Easy);
  WheelModel wheel({-1.0, -0.25}, WheelParams{});
  ChassisPose pose{{10.0, 20.0}, {0.0, -3.0}, 0.0, 0.0};

  const auto c = wheel.resolve(pose, kDt, terrain);
  REQUIRE_FALSE(c.contact);
  REQUIRE(c.force.x == 0.0);
  REQUIRE(c.force.y == 0.0);
  REQUIRE(c.torque == 0.0);
  REQUIRE(wheel.state().compression == 0.0);
  REQUIRE_FALSE(wheel.state().contact);
}

TEST_CASE("Wheel at static height carries half the weight") {
  TerrainGenerator terrain(42, DifficultyTier::Easy);
  WheelParams wp{};
  WheelModel wheel({-1.0, -0.25}, wp);
  ChassisPose pose{{10.0, static_height(wp)}, {}, 0.0, 0.0};

  const auto c = wheel.resolve(pose, kDt, terrain);
  REQUIRE(c.contact);
  REQUIRE(c.force.x == Approx(0.0).margin(1e-12));
  REQUIRE(c.force.y == Approx(kG / 2.0));
  // Upward force behind the center pitches the nose down.
  REQUIRE(c.torque == Approx(-c.force.y));
  REQUIRE(wheel.state().compression == Approx(kG / (2.0 * wp.spring_k) / wp.rest_length));
  REQUIRE(wheel.state().load == Approx(kG / 2.0));
  REQUIRE_FALSE(c.hard_hit);
}

TEST_CASE("Suspension multiplier stiffens the spring") {
  TerrainGenerator terrain(42, DifficultyTier::Easy);
  WheelParams wp{};
  WheelModel soft({1.0, -0.25}, wp, 1.0);
  WheelModel stiff({1.0, -0.25}, wp, 2.0);
  REQUIRE(stiff.spring_k() == Approx(2.0 * soft.spring_k()));

  ChassisPose pose{{10.0, static_height(wp)}, {}, 0.0, 0.0};
  const auto a = soft.resolve(pose, kDt, terrain);
  const auto b = stiff.resolve(pose, kDt, terrain);
  REQUIRE(b.force.y == Approx(2.0 * a.force.y));
}

TEST_CASE("Damping adds force while compressing and never pulls") {
  TerrainGenerator terrain(42, DifficultyTier::Easy);
  WheelParams wp{};
  WheelModel wheel({-1.0, -0.25}, wp);
  const double y = static_height(wp);

  ChassisPose falling{{10.0, y}, {0.0, -1.0}, 0.0, 0.0};
  const auto c = wheel.resolve(falling, kDt, terrain);
  REQUIRE(c.force.y == Approx(kG / 2.0 + wp.damping * 1.0));

  ChassisPose rising{{10.0, y}, {0.0, 5.0}, 0.0, 0.0};
  const auto r = wheel.resolve(rising, kDt, terrain);
  REQUIRE(r.contact);
  REQUIRE(r.force.y == 0.0);
}

TEST_CASE("Compression stays in range across a height sweep") {
  TerrainGenerator terrain(42, DifficultyTier::Easy);
  WheelModel wheel({-1.0, -0.25}, WheelParams{});
  for (double y = 0.3; y < 2.0; y += 0.05) {
    ChassisPose pose{{10.0, y}, {}, 0.0, 0.0};
    wheel.resolve(pose, kDt, terrain);
    REQUIRE(wheel.state().compression >= 0.0);
    REQUIRE(wheel.state().compression <= 1.0);
  }
}

TEST_CASE("Bottoming out reports a hard hit with impact speed") {
  TerrainGenerator terrain(42, DifficultyTier::Easy);
  WheelModel wheel({-1.0, -0.25}, WheelParams{});
  // Attachment at 0.35 m: the probe is already 5 cm past full travel.
  ChassisPose pose{{10.0, 0.6}, {0.0, -12.0}, 0.0, 0.0};

  const auto c = wheel.resolve(pose, kDt, terrain);
  REQUIRE(c.contact);
  REQUIRE(c.hard_hit);
  REQUIRE(c.impact_speed == Approx(12.0));
  REQUIRE(c.penetration == Approx(0.05));
  REQUIRE(wheel.state().compression == 1.0);
  REQUIRE(wheel.state().hard_hit);
}

TEST_CASE("Chassis on its side leaves the wheels airborne") {
  TerrainGenerator terrain(42, DifficultyTier::Easy);
  WheelModel wheel({-1.0, -0.25}, WheelParams{});
  ChassisPose pose{{10.0, 0.8}, {}, kPI / 2.0, 0.0};

  const auto c = wheel.resolve(pose, kDt, terrain);
  REQUIRE_FALSE(c.contact);
  REQUIRE(c.force.y == 0.0);
}

TEST_CASE("Rolling wheel spins backwards relative to travel") {
  TerrainGenerator terrain(42, DifficultyTier::Easy);
  WheelParams wp{};
  WheelModel wheel({1.0, -0.25}, wp);
  ChassisPose pose{{10.0, static_height(wp)}, {4.0, 0.0}, 0.0, 0.0};
  wheel.resolve(pose, kDt, terrain);
  REQUIRE(wheel.state().spin == Approx(-4.0 * kDt / wp.radius));
}
