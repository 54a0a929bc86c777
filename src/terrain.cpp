#include <hcr/terrain.hpp>
#include <algorithm>
#include <cmath>

namespace hcr {

namespace {

constexpr double kDegToRad = kPI / 180.0;
constexpr double kCoinHover = 1.2;   // above the surface
constexpr double kCanHover = 1.0;
constexpr double kHazardGap = 40.0;  // min distance between hazards
constexpr double kGentleRise = 0.8;  // max |dh| between knots for pickups / hazards

} // namespace

TerrainProfile profile_for(DifficultyTier tier) {
  TerrainProfile p{};
  switch (tier) {
    case DifficultyTier::Easy:
      p.amplitude = {6.0, 4.0, 2.0};
      p.wavelength = {180.0, 90.0, 40.0};
      p.bump = 0.2;
      p.max_slope_deg = 28.0;
      p.fuel_can_chance = 0.014;
      p.boost_chance = 0.004;
      break;
    case DifficultyTier::Medium:
      p.amplitude = {10.0, 6.0, 3.0};
      p.wavelength = {160.0, 80.0, 35.0};
      p.bump = 0.35;
      p.max_slope_deg = 33.0;
      p.fuel_can_chance = 0.013;
      p.spike_chance = 0.003;
      p.boost_chance = 0.004;
      break;
    case DifficultyTier::Hard:
      p.amplitude = {14.0, 9.0, 4.0};
      p.wavelength = {150.0, 70.0, 30.0};
      p.bump = 0.5;
      p.max_slope_deg = 38.0;
      p.dip_chance = 0.006;
      p.dip_depth = 3.0;
      p.fuel_can_chance = 0.012;
      p.spike_chance = 0.005;
      p.boost_chance = 0.003;
      break;
    case DifficultyTier::VeryHard:
      p.amplitude = {18.0, 11.0, 5.0};
      p.wavelength = {140.0, 60.0, 26.0};
      p.bump = 0.7;
      p.max_slope_deg = 42.0;
      p.dip_chance = 0.010;
      p.dip_depth = 4.0;
      p.fuel_can_chance = 0.011;
      p.spike_chance = 0.007;
      p.boost_chance = 0.003;
      break;
    case DifficultyTier::Extreme:
    case DifficultyTier::Count:
      p.amplitude = {24.0, 14.0, 7.0};
      p.wavelength = {120.0, 50.0, 22.0};
      p.bump = 1.0;
      p.max_slope_deg = 48.0;
      p.dip_chance = 0.015;
      p.dip_depth = 6.0;
      p.fuel_can_chance = 0.010;
      p.spike_chance = 0.010;
      p.boost_chance = 0.002;
      break;
  }
  return p;
}

TerrainGenerator::TerrainGenerator(std::uint32_t seed, DifficultyTier tier)
  : TerrainGenerator(seed, profile_for(tier)) {}

TerrainGenerator::TerrainGenerator(std::uint32_t seed, const TerrainProfile& profile)
  : seed_(seed), profile_(profile) {
  std::mt19937 rng(seed_);
  std::uniform_real_distribution<double> U(0.0, kTAU);
  for (auto& ph : phase_) ph = U(rng);
  last_hazard_end_ = profile_.flat_start;
}

double TerrainGenerator::knot_(std::ptrdiff_t i) const {
  if (i < 0) return knots_.front();
  return knots_[static_cast<std::size_t>(i)];
}

void TerrainGenerator::ensure_index_(std::size_t idx) const {
  while (knots_.size() <= idx) generate_chunk_();
}

void TerrainGenerator::ensure_generated(double x) const {
  if (!std::isfinite(x) || x < 0.0) x = 0.0;
  ensure_index_(static_cast<std::size_t>(x / kSpacing) + 2);
}

std::size_t TerrainGenerator::prefetch(double x_ahead, std::size_t max_chunks) {
  std::size_t made = 0;
  while (made < max_chunks && generated_until() < x_ahead) {
    generate_chunk_();
    ++made;
  }
  return made;
}

double TerrainGenerator::generated_until() const {
  // The spline segment starting at knot i needs knots i+1 and i+2.
  if (knots_.size() < 3) return 0.0;
  return double(knots_.size() - 3) * kSpacing;
}

bool TerrainGenerator::healthy() const {
  ensure_index_(2);
  return std::all_of(knots_.begin(), knots_.end(), [](double h){ return std::isfinite(h); });
}

void TerrainGenerator::generate_chunk_() const {
  const std::size_t chunk = chunks_;
  std::seed_seq shape_seq{seed_, static_cast<std::uint32_t>(chunk), 0x68696c6cu};
  std::seed_seq overlay_seq{seed_, static_cast<std::uint32_t>(chunk), 0x636f696eu};
  std::mt19937 rng(shape_seq);
  std::mt19937 overlay_rng(overlay_seq);
  std::uniform_real_distribution<double> U(0.0, 1.0);

  const double max_dh = kSpacing * std::tan(profile_.max_slope_deg * kDegToRad);
  const std::size_t first = knots_.size();
  knots_.reserve(first + kChunkPoints);

  for (std::size_t k = 0; k < kChunkPoints; ++k) {
    const std::size_t i = first + k;
    const double x = double(i) * kSpacing;
    const double blend = smoothstep(profile_.flat_start, profile_.flat_start + profile_.ramp_length, x);

    double hills = 0.0;
    for (std::size_t l = 0; l < 3; ++l) {
      if (profile_.wavelength[l] <= 0.0) continue;
      hills += profile_.amplitude[l] * std::sin(kTAU * x / profile_.wavelength[l] + phase_[l]);
    }
    // Draw unconditionally so the stream stays aligned across tiers.
    const double bump = (U(rng) * 2.0 - 1.0) * profile_.bump;
    const bool dip = U(rng) < profile_.dip_chance && blend >= 1.0;

    double target = profile_.base_height + blend * (hills + bump);
    if (dip) target -= profile_.dip_depth;

    if (i == 0) {
      knots_.push_back(profile_.base_height);
      continue;
    }
    const double prev = knots_[i - 1];
    knots_.push_back(std::clamp(target, prev - max_dh, prev + max_dh));
  }
  ++chunks_;

  place_overlay_(first, knots_.size(), overlay_rng);
}

void TerrainGenerator::place_overlay_(std::size_t first, std::size_t last, std::mt19937& rng) const {
  std::uniform_real_distribution<double> U(0.0, 1.0);
  std::uniform_int_distribution<int> row_len(3, 6);

  // Pickups sit on knots, where the spline equals the stored control value.
  std::size_t skip_until = first;
  for (std::size_t i = std::max<std::size_t>(first, 1); i + 1 < last; ++i) {
    const double x = double(i) * kSpacing;
    const double u_coin = U(rng);
    const double u_can = U(rng);
    const double u_spike = U(rng);
    const double u_boost = U(rng);
    const int len = row_len(rng);

    if (i < skip_until) continue;
    if (x < profile_.flat_start) continue;

    const bool gentle = std::abs(knots_[i + 1] - knots_[i]) < kGentleRise &&
                        std::abs(knots_[i] - knots_[i - 1]) < kGentleRise;
    if (!gentle) continue;

    if (u_coin < profile_.coin_row_chance) {
      // A row follows the ground while it stays gentle and inside this chunk.
      std::size_t j = i;
      for (int c = 0; c < len && j + 1 < last; ++c, ++j) {
        if (std::abs(knots_[j + 1] - knots_[j]) >= kGentleRise) break;
        coins_.push_back(Coin{next_coin_id_++, {double(j) * kSpacing, knots_[j] + kCoinHover}});
      }
      skip_until = j + 1;
      continue;
    }
    if (u_can < profile_.fuel_can_chance) {
      fuel_cans_.push_back(FuelCan{next_can_id_++, {x, knots_[i] + kCanHover}, 35.0});
      skip_until = i + 2;
      continue;
    }
    if (x - last_hazard_end_ < kHazardGap) continue;
    if (u_spike < profile_.spike_chance && i + 2 < last) {
      hazards_.push_back(Hazard{next_hazard_id_++, HazardKind::Spikes, x, x + 2.0 * kSpacing});
      last_hazard_end_ = x + 2.0 * kSpacing;
      skip_until = i + 3;
    } else if (u_boost < profile_.boost_chance) {
      hazards_.push_back(Hazard{next_hazard_id_++, HazardKind::Boost, x, x + kSpacing});
      last_hazard_end_ = x + kSpacing;
      skip_until = i + 2;
    }
  }
}

double TerrainGenerator::height_at(double x) const {
  if (!std::isfinite(x) || x < 0.0) x = 0.0;
  const auto i = static_cast<std::size_t>(x / kSpacing);
  ensure_index_(i + 2);
  const double u = x / kSpacing - double(i);
  const auto si = static_cast<std::ptrdiff_t>(i);
  return catmull_rom(knot_(si - 1), knot_(si), knot_(si + 1), knot_(si + 2), u);
}

double TerrainGenerator::slope_at(double x) const {
  if (!std::isfinite(x) || x < 0.0) x = 0.0;
  const auto i = static_cast<std::size_t>(x / kSpacing);
  ensure_index_(i + 2);
  const double u = x / kSpacing - double(i);
  const auto si = static_cast<std::ptrdiff_t>(i);
  const double dhdx = catmull_rom_du(knot_(si - 1), knot_(si), knot_(si + 1), knot_(si + 2), u) / kSpacing;
  const double cap = kSlopeCapDeg * kDegToRad;
  return std::clamp(std::atan(dhdx), -cap, cap);
}

Vec2 TerrainGenerator::normal_at(double x) const {
  const double a = slope_at(x);
  return {-std::sin(a), std::cos(a)};
}

Vec2 TerrainGenerator::tangent_at(double x) const {
  const double a = slope_at(x);
  return {std::cos(a), std::sin(a)};
}

std::vector<Coin> TerrainGenerator::coins_between(double x0, double x1) const {
  ensure_generated(x1 + kSpacing);
  std::vector<Coin> out;
  auto it = std::lower_bound(coins_.begin(), coins_.end(), x0,
                             [](const Coin& c, double x){ return c.position.x < x; });
  for (; it != coins_.end() && it->position.x <= x1; ++it) out.push_back(*it);
  return out;
}

std::vector<FuelCan> TerrainGenerator::fuel_cans_between(double x0, double x1) const {
  ensure_generated(x1 + kSpacing);
  std::vector<FuelCan> out;
  auto it = std::lower_bound(fuel_cans_.begin(), fuel_cans_.end(), x0,
                             [](const FuelCan& c, double x){ return c.position.x < x; });
  for (; it != fuel_cans_.end() && it->position.x <= x1; ++it) out.push_back(*it);
  return out;
}

std::vector<Hazard> TerrainGenerator::hazards_between(double x0, double x1) const {
  ensure_generated(x1 + kSpacing);
  std::vector<Hazard> out;
  for (const auto& h : hazards_) {
    if (h.x_end < x0) continue;
    if (h.x_begin > x1) break;
    out.push_back(h);
  }
  return out;
}

std::optional<Hazard> TerrainGenerator::hazard_at(double x) const {
  ensure_generated(x);
  auto it = std::lower_bound(hazards_.begin(), hazards_.end(), x,
                             [](const Hazard& h, double v){ return h.x_end < v; });
  if (it != hazards_.end() && it->x_begin <= x && x <= it->x_end) return *it;
  return std::nullopt;
}

} // namespace hcr
