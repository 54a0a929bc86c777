#include <hcr/level.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace hcr {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return false;
  return (cols[0] == "name" || cols[0] == "Name");
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

static std::uint32_t to_seed_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    const long long v = std::stoll(s, &idx);
    ok = idx == s.size() && v >= 0 &&
         v <= static_cast<long long>(std::numeric_limits<std::uint32_t>::max());
    return ok ? static_cast<std::uint32_t>(v) : 0u;
  } catch (const std::exception&) {
    ok = false;
    return 0u;
  }
}

const char* tier_name(DifficultyTier tier) {
  switch (tier) {
    case DifficultyTier::Easy:     return "Easy";
    case DifficultyTier::Medium:   return "Medium";
    case DifficultyTier::Hard:     return "Hard";
    case DifficultyTier::VeryHard: return "Very Hard";
    case DifficultyTier::Extreme:  return "Extreme";
    case DifficultyTier::Count:    break;
  }
  return "Unknown";
}

std::optional<DifficultyTier> tier_from_string(const std::string& s) {
  auto squash = [](const std::string& in) {
    std::string out;
    for (unsigned char c : in) {
      if (std::isspace(c) || c == '_' || c == '-') continue;
      out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
  };
  const auto key = squash(s);
  for (int i = 0; i < static_cast<int>(DifficultyTier::Count); ++i) {
    const auto t = static_cast<DifficultyTier>(i);
    if (key == squash(tier_name(t))) return t;
  }
  return std::nullopt;
}

std::optional<ConfigError> validate_level_params(const LevelParams& p) {
  const int tier = static_cast<int>(p.difficulty);
  if (tier < 0 || tier >= static_cast<int>(DifficultyTier::Count)) {
    return ConfigError{"difficulty", "unknown difficulty tier"};
  }
  if (!std::isfinite(p.gravity_scale) || p.gravity_scale <= 0.0) {
    return ConfigError{"gravity_scale", "must be a finite value > 0"};
  }
  if (!std::isfinite(p.friction_coefficient) || p.friction_coefficient < 0.0 || p.friction_coefficient > 1.0) {
    return ConfigError{"friction_coefficient", "must be in [0, 1]"};
  }
  if (!std::isfinite(p.air_resistance) || p.air_resistance < 0.0 || p.air_resistance > 1.0) {
    return ConfigError{"air_resistance", "must be in [0, 1]"};
  }
  if (!std::isfinite(p.target_distance) || p.target_distance <= 0.0) {
    return ConfigError{"target_distance", "must be a finite value > 0"};
  }
  for (std::size_t i = 0; i < kUpgradeKindCount; ++i) {
    const auto kind = static_cast<UpgradeKind>(i);
    if (!multiplier_in_range(multiplier_for(p.upgrades, kind))) {
      return ConfigError{std::string("upgrades.") + upgrade_name(kind), "multiplier must be in [1.0, 3.0]"};
    }
  }
  return std::nullopt;
}

static std::optional<LevelParams> parse_level_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return std::nullopt;
  LevelParams lp{};
  lp.name = cols[0];
  if (lp.name.empty()) return std::nullopt;

  const auto tier = tier_from_string(cols[1]);
  if (!tier) return std::nullopt;
  lp.difficulty = *tier;

  bool ok_seed, ok_target;
  lp.seed = to_seed_safe(cols[2], ok_seed);
  lp.target_distance = to_double_safe(cols[3], ok_target);
  if (!(ok_seed && ok_target)) return std::nullopt;

  // Optional physics columns; an empty cell keeps the default.
  double* optional_cols[] = {&lp.gravity_scale, &lp.friction_coefficient, &lp.air_resistance};
  for (std::size_t i = 0; i < 3 && 4 + i < cols.size(); ++i) {
    if (cols[4 + i].empty()) continue;
    bool ok;
    const double v = to_double_safe(cols[4 + i], ok);
    if (!ok) return std::nullopt;
    *optional_cols[i] = v;
  }
  return lp;
}

static std::vector<LevelParams> make_catalog_builtin() {
  auto level = [](const char* name, DifficultyTier tier, std::uint32_t seed, double target) {
    LevelParams lp{};
    lp.name = name;
    lp.difficulty = tier;
    lp.seed = seed;
    lp.target_distance = target;
    return lp;
  };
  return {
    level("Mountain Valley", DifficultyTier::Easy,     42,  5000.0),
    level("Rocky Hills",     DifficultyTier::Medium,   123, 8000.0),
    level("Desert Dunes",    DifficultyTier::Hard,     456, 12000.0),
    level("Alpine Peak",     DifficultyTier::VeryHard, 789, 15000.0),
    level("Volcanic Crater", DifficultyTier::Extreme,  999, 20000.0),
  };
}

const std::vector<LevelParams>& level_catalog() {
  static const std::vector<LevelParams> cat = make_catalog_builtin();
  return cat;
}

std::optional<LevelParams> level_by_name(const std::string& name) {
  return level_by_name_in(level_catalog(), name);
}

std::optional<LevelParams> level_by_name_in(const std::vector<LevelParams>& cat, const std::string& name) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const LevelParams& l){ return l.name == name; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<LevelParams> level_catalog_from_csv_stream(std::istream& in) {
  std::vector<LevelParams> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_level_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<LevelParams>> load_level_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return level_catalog_from_csv_stream(f);
}

} // namespace hcr
