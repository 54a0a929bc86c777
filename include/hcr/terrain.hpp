#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>
#include <hcr/geom.hpp>
#include <hcr/level.hpp>

namespace hcr {

using PickupId = std::uint32_t;
using HazardId = std::uint32_t;

struct Coin {
  PickupId id = 0;
  Vec2 position{};
};

struct FuelCan {
  PickupId id = 0;
  Vec2 position{};
  double amount = 35.0; // fuel units restored
};

enum class HazardKind { Spikes, Boost };

// Horizontal span checked against wheel contacts, independent of the height function.
struct Hazard {
  HazardId id = 0;
  HazardKind kind = HazardKind::Spikes;
  double x_begin = 0.0;
  double x_end = 0.0;
};

// Shape and overlay density for one difficulty tier.
struct TerrainProfile {
  double base_height = 0.0;
  std::array<double, 3> amplitude{0.0, 0.0, 0.0};   // meters per sine layer
  std::array<double, 3> wavelength{1.0, 1.0, 1.0};  // meters per sine layer
  double bump = 0.0;            // max random offset per control point
  double max_slope_deg = 30.0;  // drivable limit between control points
  double dip_chance = 0.0;      // per control point, after the run-up
  double dip_depth = 0.0;
  double flat_start = 120.0;    // flat run-up length
  double ramp_length = 60.0;    // blend from flat into hills
  double coin_row_chance = 0.04;
  double fuel_can_chance = 0.012;
  double spike_chance = 0.0;
  double boost_chance = 0.0;
};

TerrainProfile profile_for(DifficultyTier tier);

// Procedural height field y = h(x), generated lazily in fixed-size chunks.
// Control points are spaced kSpacing apart and joined by a uniform Catmull–Rom
// spline, so h is continuous with a continuous first derivative. Chunks are
// always produced in order from per-chunk seeds; a value returned once is
// returned again for the rest of the run. x < 0 reads h(0).
class TerrainGenerator {
public:
  static constexpr double kSpacing = 4.0;             // meters between control points
  static constexpr std::size_t kChunkPoints = 64;     // control points per chunk
  static constexpr double kSlopeCapDeg = 75.0;        // slope_at never reports more

  TerrainGenerator(std::uint32_t seed, DifficultyTier tier);
  TerrainGenerator(std::uint32_t seed, const TerrainProfile& profile);

  double height_at(double x) const;
  double slope_at(double x) const;     // radians, positive uphill to the right
  Vec2   normal_at(double x) const;    // unit, y > 0
  Vec2   tangent_at(double x) const;   // unit, x > 0

  // Generates whatever is missing so that [0, x] can be sampled.
  void ensure_generated(double x) const;
  // Generates at most max_chunks chunks toward x_ahead; returns chunks generated.
  std::size_t prefetch(double x_ahead, std::size_t max_chunks);

  double generated_until() const;
  std::size_t chunk_count() const { return chunks_; }
  bool healthy() const;  // every generated control point is finite

  // Overlay queries (generate on demand up to x1). Results are ordered by x.
  std::vector<Coin>    coins_between(double x0, double x1) const;
  std::vector<FuelCan> fuel_cans_between(double x0, double x1) const;
  std::vector<Hazard>  hazards_between(double x0, double x1) const;
  std::optional<Hazard> hazard_at(double x) const;

  std::uint32_t seed() const { return seed_; }
  const TerrainProfile& profile() const { return profile_; }

private:
  void ensure_index_(std::size_t idx) const;
  void generate_chunk_() const;
  void place_overlay_(std::size_t first, std::size_t last, std::mt19937& rng) const;
  double knot_(std::ptrdiff_t i) const;

  std::uint32_t seed_;
  TerrainProfile profile_;
  std::array<double, 3> phase_{};

  // Lazily extended cache; logically const.
  mutable std::vector<double> knots_;
  mutable std::size_t chunks_{0};
  mutable std::vector<Coin> coins_;
  mutable std::vector<FuelCan> fuel_cans_;
  mutable std::vector<Hazard> hazards_;
  mutable PickupId next_coin_id_{0};
  mutable PickupId next_can_id_{0};
  mutable HazardId next_hazard_id_{0};
  mutable double last_hazard_end_{0.0};
};

} // namespace hcr
