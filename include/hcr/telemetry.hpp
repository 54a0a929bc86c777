#pragma once
#include <algorithm>
#include <cstdint>
#include <variant>
#include <vector>
#include <hcr/car.hpp>
#include <hcr/events.hpp>
#include <hcr/physics_stepper.hpp>

namespace hcr {

struct RunStats {
  double elapsed{0.0};
  double distance{0.0};
  double top_speed{0.0};
  double airtime_total{0.0};
  double longest_air{0.0};
  double damage_taken{0.0};
  double fuel_used{0.0};
  std::uint32_t flips{0};
  std::uint32_t coins{0};
  std::uint32_t fuel_cans{0};
  std::uint32_t hazards{0};
  std::uint64_t steps{0};
};

// Per-run statistics, fed once per fixed step after events are detected.
class RunTelemetry {
public:
  void update(const CarModel& car, const StepReport& rep, const std::vector<GameEvent>& events, double dt) {
    const auto& s = car.state();
    stats_.elapsed += dt;
    ++stats_.steps;
    stats_.distance = s.distance;
    stats_.top_speed = std::max(stats_.top_speed, car.speed());
    stats_.damage_taken += rep.damage;
    stats_.fuel_used += rep.fuel_burned;

    if (!rep.supported) {
      stats_.airtime_total += dt;
      current_air_ += dt;
      stats_.longest_air = std::max(stats_.longest_air, current_air_);
    } else {
      current_air_ = 0.0;
    }

    for (const auto& e : events) {
      if (std::holds_alternative<Flipped>(e))              ++stats_.flips;
      else if (std::holds_alternative<CoinCollected>(e))   ++stats_.coins;
      else if (std::holds_alternative<FuelCollected>(e))   ++stats_.fuel_cans;
      else if (std::holds_alternative<HazardTriggered>(e)) ++stats_.hazards;
    }
  }

  const RunStats& stats() const { return stats_; }
  void reset() { stats_ = RunStats{}; current_air_ = 0.0; }

private:
  RunStats stats_{};
  double current_air_{0.0};
};

} // namespace hcr
