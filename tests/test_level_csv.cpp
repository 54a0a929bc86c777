#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <hcr/level.hpp>

using Catch::Approx;
using namespace hcr;

TEST_CASE("Level CSV: basic parse with header, comments and blanks") {
  const char* csv = R"(
# custom levels
name,difficulty,seed,target_distance,gravity_scale,friction,air_resistance

Moon Walk, Easy, 7, 3000, 0.16, 0.4, 0.0
Lava Run,  very hard, 31337, 9000
Sticky Mud, medium, 5, 2500, , 0.95,
)";
  std::istringstream in(csv);
  auto cat = level_catalog_from_csv_stream(in);
  REQUIRE(cat.size() == 3);

  REQUIRE(cat[0].name == "Moon Walk");
  REQUIRE(cat[0].difficulty == DifficultyTier::Easy);
  REQUIRE(cat[0].seed == 7);
  REQUIRE(cat[0].target_distance == Approx(3000.0));
  REQUIRE(cat[0].gravity_scale == Approx(0.16));
  REQUIRE(cat[0].friction_coefficient == Approx(0.4));
  REQUIRE(cat[0].air_resistance == Approx(0.0));

  REQUIRE(cat[1].name == "Lava Run");
  REQUIRE(cat[1].difficulty == DifficultyTier::VeryHard);
  REQUIRE(cat[1].seed == 31337);
  REQUIRE(cat[1].gravity_scale == Approx(1.0));   // default
  REQUIRE(cat[1].air_resistance == Approx(0.1));  // default

  // Empty cells keep defaults.
  REQUIRE(cat[2].gravity_scale == Approx(1.0));
  REQUIRE(cat[2].friction_coefficient == Approx(0.95));
  REQUIRE(cat[2].air_resistance == Approx(0.1));
}

TEST_CASE("Level CSV: bad rows are skipped") {
  const char* csv = R"(
Good,Easy,1,1000
NoTier,Nightmare,2,1000
NegativeSeed,Easy,-5,1000
HugeSeed,Easy,99999999999,1000
BadTarget,Easy,3,far
Short,Easy,4
BadGravity,Easy,5,1000,heavy
,Easy,6,1000
Also Good,Hard,8,4000
)";
  std::istringstream in(csv);
  auto cat = level_catalog_from_csv_stream(in);
  REQUIRE(cat.size() == 2);
  REQUIRE(cat[0].name == "Good");
  REQUIRE(cat[1].name == "Also Good");
  REQUIRE(cat[1].difficulty == DifficultyTier::Hard);
}

TEST_CASE("Level CSV: values are loaded as-is and checked later") {
  std::istringstream in("Upside Down,Easy,1,1000,-1.0\n");
  auto cat = level_catalog_from_csv_stream(in);
  REQUIRE(cat.size() == 1);
  REQUIRE(cat[0].gravity_scale == Approx(-1.0));
  auto err = validate_level_params(cat[0]);
  REQUIRE(err.has_value());
  REQUIRE(err->field == "gravity_scale");
}

TEST_CASE("Level CSV: missing file") {
  auto cat = load_level_catalog_csv("/nonexistent/path/levels.csv");
  REQUIRE_FALSE(cat.has_value());
}
