#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <string>
#include <hcr/upgrades.hpp>

using Catch::Approx;
using namespace hcr;

TEST_CASE("Upgrade kinds round-trip through their names") {
  for (std::size_t i = 0; i < kUpgradeKindCount; ++i) {
    const auto kind = static_cast<UpgradeKind>(i);
    auto parsed = upgrade_kind_from_string(upgrade_name(kind));
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == kind);
  }
  REQUIRE(upgrade_kind_from_string("TRACTION") == UpgradeKind::Traction);
  REQUIRE_FALSE(upgrade_kind_from_string("nitro").has_value());
}

TEST_CASE("Default multipliers are all 1.0") {
  UpgradeMultipliers m{};
  for (std::size_t i = 0; i < kUpgradeKindCount; ++i) {
    REQUIRE(multiplier_for(m, static_cast<UpgradeKind>(i)) == 1.0);
  }
}

TEST_CASE("Levels scale multipliers by their step and cap at 3.0") {
  UpgradeLevels lv{1, 2, 0, 0, 0};
  auto m = multipliers_from_levels(lv);
  REQUIRE(m.acceleration == Approx(1.15));
  REQUIRE(m.top_speed == Approx(1.40));
  REQUIRE(m.traction == 1.0);

  lv = {100, 100, 100, 100, 100};
  m = multipliers_from_levels(lv);
  for (std::size_t i = 0; i < kUpgradeKindCount; ++i) {
    REQUIRE(multiplier_for(m, static_cast<UpgradeKind>(i)) == kUpgradeMax);
  }

  lv = {-3, 0, 0, 0, 0};
  m = multipliers_from_levels(lv);
  REQUIRE(m.acceleration == 1.0);
}

TEST_CASE("set_multiplier writes only the named field") {
  UpgradeMultipliers m{};
  set_multiplier(m, UpgradeKind::Suspension, 2.5);
  REQUIRE(m.suspension == 2.5);
  REQUIRE(m.acceleration == 1.0);
  REQUIRE(multiplier_for(m, UpgradeKind::Suspension) == 2.5);
}

TEST_CASE("Multiplier range check") {
  REQUIRE(multiplier_in_range(1.0));
  REQUIRE(multiplier_in_range(3.0));
  REQUIRE(multiplier_in_range(2.2));
  REQUIRE_FALSE(multiplier_in_range(0.99));
  REQUIRE_FALSE(multiplier_in_range(3.01));
  REQUIRE_FALSE(multiplier_in_range(std::numeric_limits<double>::quiet_NaN()));
  REQUIRE_FALSE(multiplier_in_range(std::numeric_limits<double>::infinity()));
}
