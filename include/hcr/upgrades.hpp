#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace hcr {

inline constexpr double kUpgradeMin = 1.0;
inline constexpr double kUpgradeMax = 3.0;

// Scalar factors fed straight into the physics formulas. Read-only to the core.
struct UpgradeMultipliers {
  double acceleration = 1.0;     // throttle force
  double top_speed = 1.0;        // engine taper speed
  double traction = 1.0;         // tire friction limit
  double fuel_efficiency = 1.0;  // higher = slower fuel burn
  double suspension = 1.0;       // spring constant
};

enum class UpgradeKind : int {
  Acceleration = 0,
  TopSpeed,
  Traction,
  FuelEfficiency,
  Suspension,
  Count
};

inline constexpr std::size_t kUpgradeKindCount = static_cast<std::size_t>(UpgradeKind::Count);

// Purchased level per kind, indexed by UpgradeKind.
using UpgradeLevels = std::array<int, kUpgradeKindCount>;

const char* upgrade_name(UpgradeKind kind);

// Case-insensitive; accepts the short keys ("acceleration", "top_speed", ...).
std::optional<UpgradeKind> upgrade_kind_from_string(const std::string& s);

double multiplier_for(const UpgradeMultipliers& m, UpgradeKind kind);
void set_multiplier(UpgradeMultipliers& m, UpgradeKind kind, double value);

// Multiplier gained per purchased level.
double upgrade_step(UpgradeKind kind);

// 1.0 + level * step, capped at kUpgradeMax. Negative levels count as zero.
UpgradeMultipliers multipliers_from_levels(const UpgradeLevels& levels);

bool multiplier_in_range(double v);

} // namespace hcr
