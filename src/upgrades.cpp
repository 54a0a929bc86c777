#include <hcr/upgrades.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace hcr {

static inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

const char* upgrade_name(UpgradeKind kind) {
  switch (kind) {
    case UpgradeKind::Acceleration:   return "acceleration";
    case UpgradeKind::TopSpeed:       return "top_speed";
    case UpgradeKind::Traction:       return "traction";
    case UpgradeKind::FuelEfficiency: return "fuel_efficiency";
    case UpgradeKind::Suspension:     return "suspension";
    case UpgradeKind::Count:          break;
  }
  return "unknown";
}

std::optional<UpgradeKind> upgrade_kind_from_string(const std::string& s) {
  const auto k = lower(s);
  for (std::size_t i = 0; i < kUpgradeKindCount; ++i) {
    const auto kind = static_cast<UpgradeKind>(i);
    if (k == upgrade_name(kind)) return kind;
  }
  return std::nullopt;
}

double multiplier_for(const UpgradeMultipliers& m, UpgradeKind kind) {
  switch (kind) {
    case UpgradeKind::Acceleration:   return m.acceleration;
    case UpgradeKind::TopSpeed:       return m.top_speed;
    case UpgradeKind::Traction:       return m.traction;
    case UpgradeKind::FuelEfficiency: return m.fuel_efficiency;
    case UpgradeKind::Suspension:     return m.suspension;
    case UpgradeKind::Count:          break;
  }
  return 1.0;
}

void set_multiplier(UpgradeMultipliers& m, UpgradeKind kind, double value) {
  switch (kind) {
    case UpgradeKind::Acceleration:   m.acceleration = value; break;
    case UpgradeKind::TopSpeed:       m.top_speed = value; break;
    case UpgradeKind::Traction:       m.traction = value; break;
    case UpgradeKind::FuelEfficiency: m.fuel_efficiency = value; break;
    case UpgradeKind::Suspension:     m.suspension = value; break;
    case UpgradeKind::Count:          break;
  }
}

double upgrade_step(UpgradeKind kind) {
  // Engine Upgrade, Turbo Kit, Racing Tires, Fuel Tank, Suspension System
  switch (kind) {
    case UpgradeKind::Acceleration:   return 0.15;
    case UpgradeKind::TopSpeed:       return 0.20;
    case UpgradeKind::Traction:       return 0.18;
    case UpgradeKind::FuelEfficiency: return 0.22;
    case UpgradeKind::Suspension:     return 0.25;
    case UpgradeKind::Count:          break;
  }
  return 0.0;
}

UpgradeMultipliers multipliers_from_levels(const UpgradeLevels& levels) {
  UpgradeMultipliers m{};
  for (std::size_t i = 0; i < kUpgradeKindCount; ++i) {
    const auto kind = static_cast<UpgradeKind>(i);
    const int lvl = std::max(0, levels[i]);
    set_multiplier(m, kind, std::min(kUpgradeMax, kUpgradeMin + lvl * upgrade_step(kind)));
  }
  return m;
}

bool multiplier_in_range(double v) {
  return std::isfinite(v) && v >= kUpgradeMin && v <= kUpgradeMax;
}

} // namespace hcr
