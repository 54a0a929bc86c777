#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <string>
#include <hcr/level.hpp>

using Catch::Approx;
using namespace hcr;

TEST_CASE("Built-in catalog has five levels in tier order") {
  const auto& cat = level_catalog();
  REQUIRE(cat.size() == 5);
  REQUIRE(cat[0].name == "Mountain Valley");
  REQUIRE(cat[0].difficulty == DifficultyTier::Easy);
  REQUIRE(cat[0].seed == 42);
  REQUIRE(cat[0].target_distance == Approx(5000.0));
  REQUIRE(cat[4].name == "Volcanic Crater");
  REQUIRE(cat[4].difficulty == DifficultyTier::Extreme);
  REQUIRE(cat[4].target_distance == Approx(20000.0));

  for (std::size_t i = 0; i < cat.size(); ++i) {
    REQUIRE(static_cast<int>(cat[i].difficulty) == static_cast<int>(i));
    REQUIRE_FALSE(validate_level_params(cat[i]).has_value());
  }
}

TEST_CASE("Level lookup by name") {
  auto lvl = level_by_name("Desert Dunes");
  REQUIRE(lvl.has_value());
  REQUIRE(lvl->seed == 456);
  REQUIRE(lvl->difficulty == DifficultyTier::Hard);
  REQUIRE_FALSE(level_by_name("Moon Base").has_value());
}

TEST_CASE("Tier names parse loosely") {
  REQUIRE(tier_from_string("Very Hard") == DifficultyTier::VeryHard);
  REQUIRE(tier_from_string("very_hard") == DifficultyTier::VeryHard);
  REQUIRE(tier_from_string("VERY-HARD") == DifficultyTier::VeryHard);
  REQUIRE(tier_from_string("extreme") == DifficultyTier::Extreme);
  REQUIRE_FALSE(tier_from_string("insane").has_value());
  REQUIRE(std::string(tier_name(DifficultyTier::Medium)) == "Medium");
}

TEST_CASE("Defaults validate") {
  LevelParams p{};
  REQUIRE_FALSE(validate_level_params(p).has_value());

  p.friction_coefficient = 0.0;
  p.air_resistance = 1.0;
  REQUIRE_FALSE(validate_level_params(p).has_value());
}

TEST_CASE("Each out-of-range field is reported by name") {
  const double nan = std::numeric_limits<double>::quiet_NaN();

  auto field_of = [](const LevelParams& p) {
    auto err = validate_level_params(p);
    REQUIRE(err.has_value());
    REQUIRE_FALSE(err->message.empty());
    return err->field;
  };

  LevelParams p{};
  p.gravity_scale = 0.0;
  REQUIRE(field_of(p) == "gravity_scale");
  p.gravity_scale = nan;
  REQUIRE(field_of(p) == "gravity_scale");

  p = LevelParams{};
  p.friction_coefficient = 1.5;
  REQUIRE(field_of(p) == "friction_coefficient");
  p.friction_coefficient = -0.1;
  REQUIRE(field_of(p) == "friction_coefficient");

  p = LevelParams{};
  p.air_resistance = 2.0;
  REQUIRE(field_of(p) == "air_resistance");

  p = LevelParams{};
  p.target_distance = -10.0;
  REQUIRE(field_of(p) == "target_distance");
  p.target_distance = std::numeric_limits<double>::infinity();
  REQUIRE(field_of(p) == "target_distance");

  p = LevelParams{};
  p.upgrades.traction = 3.5;
  REQUIRE(field_of(p) == "upgrades.traction");
  p.upgrades.traction = 1.0;
  p.upgrades.fuel_efficiency = 0.5;
  REQUIRE(field_of(p) == "upgrades.fuel_efficiency");

  p = LevelParams{};
  p.difficulty = static_cast<DifficultyTier>(17);
  REQUIRE(field_of(p) == "difficulty");
}

TEST_CASE("Validation reports without correcting") {
  LevelParams p{};
  p.air_resistance = 5.0;
  REQUIRE(validate_level_params(p).has_value());
  REQUIRE(p.air_resistance == 5.0);
}
