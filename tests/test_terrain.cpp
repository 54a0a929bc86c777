#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <vector>
#include <hcr/terrain.hpp>

using Catch::Approx;
using namespace hcr;

static TerrainProfile flat_profile() {
  TerrainProfile p{};
  p.amplitude = {0.0, 0.0, 0.0};
  p.bump = 0.0;
  p.flat_start = 0.0;
  p.ramp_length = 0.0;
  p.coin_row_chance = 0.0;
  p.fuel_can_chance = 0.0;
  p.spike_chance = 0.0;
  p.boost_chance = 0.0;
  return p;
}

TEST_CASE("Same seed and tier produce identical heights") {
  TerrainGenerator a(42, DifficultyTier::Medium);
  TerrainGenerator b(42, DifficultyTier::Medium);
  for (double x = 0.0; x < 3000.0; x += 1.7) {
    REQUIRE(a.height_at(x) == b.height_at(x));
    REQUIRE(a.slope_at(x) == b.slope_at(x));
  }
}

TEST_CASE("Different seeds produce different hills") {
  TerrainGenerator a(42, DifficultyTier::Easy);
  TerrainGenerator b(43, DifficultyTier::Easy);
  double max_diff = 0.0;
  for (double x = 200.0; x < 1200.0; x += 5.0) {
    max_diff = std::max(max_diff, std::abs(a.height_at(x) - b.height_at(x)));
  }
  REQUIRE(max_diff > 0.5);
}

TEST_CASE("Extending the terrain never changes earlier heights") {
  TerrainGenerator t(123, DifficultyTier::Hard);
  std::vector<double> first;
  for (double x = 0.0; x <= 1000.0; x += 0.5) first.push_back(t.height_at(x));

  t.ensure_generated(8000.0);
  REQUIRE(t.generated_until() >= 8000.0);

  std::size_t i = 0;
  for (double x = 0.0; x <= 500.0; x += 0.5, ++i) {
    REQUIRE(t.height_at(x) == first[i]);
  }

  // Querying far ahead first gives the same near heights as querying in order.
  TerrainGenerator far_first(123, DifficultyTier::Hard);
  (void)far_first.height_at(6000.0);
  i = 0;
  for (double x = 0.0; x <= 500.0; x += 0.5, ++i) {
    REQUIRE(far_first.height_at(x) == first[i]);
  }
}

TEST_CASE("Height is continuous, including across control points") {
  TerrainGenerator t(999, DifficultyTier::Extreme);
  const double eps = 1e-7;
  for (double x = 0.0; x < 2000.0; x += 0.37) {
    REQUIRE(std::abs(t.height_at(x + eps) - t.height_at(x)) < 1e-4);
  }
  for (int k = 1; k < 400; ++k) {
    const double x = k * TerrainGenerator::kSpacing;
    REQUIRE(t.height_at(x - 1e-9) == Approx(t.height_at(x + 1e-9)).margin(1e-6));
  }
}

TEST_CASE("Run-up is flat at the base height") {
  for (int tier = 0; tier < static_cast<int>(DifficultyTier::Count); ++tier) {
    TerrainGenerator t(42, static_cast<DifficultyTier>(tier));
    for (double x = 0.0; x <= 100.0; x += 0.25) {
      REQUIRE(t.height_at(x) == Approx(0.0).margin(1e-12));
      REQUIRE(t.slope_at(x) == Approx(0.0).margin(1e-12));
    }
  }
}

TEST_CASE("Slope stays under the cap and normals are unit, pointing up") {
  TerrainGenerator t(999, DifficultyTier::Extreme);
  const double cap = TerrainGenerator::kSlopeCapDeg * kPI / 180.0;
  for (double x = 0.0; x < 5000.0; x += 0.9) {
    const double a = t.slope_at(x);
    REQUIRE(std::abs(a) <= cap + 1e-12);
    const Vec2 n = t.normal_at(x);
    REQUIRE(length(n) == Approx(1.0));
    REQUIRE(n.y > 0.0);
    const Vec2 tg = t.tangent_at(x);
    REQUIRE(dot(n, tg) == Approx(0.0).margin(1e-12));
    REQUIRE(tg.x > 0.0);
  }
}

TEST_CASE("Harder tiers have taller hills") {
  auto range = [](DifficultyTier tier) {
    TerrainGenerator t(456, tier);
    double lo = 1e9, hi = -1e9;
    for (double x = 200.0; x < 4000.0; x += 2.0) {
      lo = std::min(lo, t.height_at(x));
      hi = std::max(hi, t.height_at(x));
    }
    return hi - lo;
  };
  REQUIRE(range(DifficultyTier::Extreme) > range(DifficultyTier::Easy));
}

TEST_CASE("Positions left of the origin read the height at zero") {
  TerrainGenerator t(42, DifficultyTier::Easy);
  REQUIRE(t.height_at(-50.0) == t.height_at(0.0));
  REQUIRE(t.height_at(std::numeric_limits<double>::quiet_NaN()) == t.height_at(0.0));
  REQUIRE(t.healthy());
}

TEST_CASE("Prefetch generates a bounded number of chunks") {
  TerrainGenerator t(42, DifficultyTier::Easy);
  REQUIRE(t.chunk_count() == 0);
  REQUIRE(t.prefetch(100000.0, 2) == 2);
  REQUIRE(t.chunk_count() == 2);
  const double until = t.generated_until();
  REQUIRE(until == Approx((2 * TerrainGenerator::kChunkPoints - 3) * TerrainGenerator::kSpacing));

  // Nothing to do when already far enough.
  REQUIRE(t.prefetch(until - 10.0, 4) == 0);
  REQUIRE(t.chunk_count() == 2);
}

TEST_CASE("Coins float above gentle ground, ordered with unique ids") {
  TerrainGenerator t(42, DifficultyTier::Easy);
  const auto coins = t.coins_between(0.0, 8000.0);
  REQUIRE_FALSE(coins.empty());

  std::set<PickupId> ids;
  for (std::size_t i = 0; i < coins.size(); ++i) {
    REQUIRE(ids.insert(coins[i].id).second);
    REQUIRE(coins[i].position.x >= t.profile().flat_start);
    REQUIRE(coins[i].position.y == Approx(t.height_at(coins[i].position.x) + 1.2));
    if (i > 0) REQUIRE(coins[i].position.x > coins[i-1].position.x);
  }

  TerrainGenerator again(42, DifficultyTier::Easy);
  const auto coins2 = again.coins_between(0.0, 8000.0);
  REQUIRE(coins2.size() == coins.size());
  for (std::size_t i = 0; i < coins.size(); ++i) {
    REQUIRE(coins2[i].id == coins[i].id);
    REQUIRE(coins2[i].position.x == coins[i].position.x);
  }
}

TEST_CASE("Easy terrain has no spike pits") {
  TerrainGenerator t(42, DifficultyTier::Easy);
  for (const auto& h : t.hazards_between(0.0, 20000.0)) {
    REQUIRE(h.kind == HazardKind::Boost);
  }
}

TEST_CASE("Hazards are spaced apart and found by position") {
  auto p = flat_profile();
  p.spike_chance = 0.5;
  p.boost_chance = 0.5;
  TerrainGenerator t(7, p);

  const auto hz = t.hazards_between(0.0, 3000.0);
  REQUIRE(hz.size() > 10);
  for (std::size_t i = 0; i < hz.size(); ++i) {
    REQUIRE(hz[i].x_end > hz[i].x_begin);
    if (i > 0) REQUIRE(hz[i].x_begin - hz[i-1].x_end >= 40.0 - 1e-9);

    const double mid = 0.5 * (hz[i].x_begin + hz[i].x_end);
    const auto found = t.hazard_at(mid);
    REQUIRE(found.has_value());
    REQUIRE(found->id == hz[i].id);
  }
  // Between two hazards there is nothing.
  REQUIRE_FALSE(t.hazard_at(hz[0].x_end + 10.0).has_value());
}

TEST_CASE("Fuel cans carry the refill amount") {
  auto p = flat_profile();
  p.fuel_can_chance = 1.0;
  TerrainGenerator t(1, p);
  const auto cans = t.fuel_cans_between(0.0, 200.0);
  REQUIRE(cans.size() > 5);
  for (const auto& c : cans) {
    REQUIRE(c.amount == Approx(35.0));
    REQUIRE(c.position.y > t.height_at(c.position.x));
  }
}
