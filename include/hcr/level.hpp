#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <hcr/upgrades.hpp>

namespace hcr {

enum class DifficultyTier : int {
  Easy = 0,
  Medium,
  Hard,
  VeryHard,
  Extreme,
  Count
};

const char* tier_name(DifficultyTier tier);

// Case-insensitive; spaces, '_' and '-' are ignored ("Very Hard" == "very_hard").
std::optional<DifficultyTier> tier_from_string(const std::string& s);

// Read once at level start.
struct LevelParams {
  std::string name;                  // e.g., "Mountain Valley"
  std::uint32_t seed = 42;
  DifficultyTier difficulty = DifficultyTier::Easy;
  double gravity_scale = 1.0;        // > 0
  double friction_coefficient = 0.6; // [0,1]
  double air_resistance = 0.1;       // [0,1]
  double target_distance = 5000.0;   // meters, > 0
  UpgradeMultipliers upgrades{};
};

struct ConfigError {
  std::string field;
  std::string message;
};

// First violation found, or nullopt when the parameters are usable as-is.
// Never clamps: out-of-range input is reported, not corrected.
std::optional<ConfigError> validate_level_params(const LevelParams& p);

// Built-in catalog (default/fallback).
const std::vector<LevelParams>& level_catalog();

std::optional<LevelParams> level_by_name(const std::string& name);
std::optional<LevelParams> level_by_name_in(const std::vector<LevelParams>& cat, const std::string& name);

// Columns: name,difficulty,seed,target_distance[,gravity_scale,friction,air_resistance]
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Rows that do not parse are skipped;
// values are not range-checked here (see validate_level_params).
std::vector<LevelParams> level_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<LevelParams>> load_level_catalog_csv(const std::string& path);

} // namespace hcr
