#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <hcr/telemetry.hpp>
#include <hcr/terrain.hpp>

namespace hcr {

enum class RunStatus : int {
  Running = 0,
  Crashed,
  Stalled,    // out of fuel and at rest
  Completed,  // target reached; driving continues
};

const char* run_status_name(RunStatus s);

struct WheelPose {
  double x = 0.0;             // hub, world (m)
  double y = 0.0;
  double spin = 0.0;          // rad
  double compression = 0.0;   // [0,1]
  bool contact = false;
};

// Chassis and wheels for drawing.
struct CarSnapshot {
  double x = 0.0;
  double y = 0.0;
  double angle = 0.0;         // rad, CCW
  std::array<WheelPose, 2> wheels{};  // rear, front
};

// Read-only numbers for the HUD.
struct HudSnapshot {
  double speed = 0.0;           // m/s
  double fuel_percent = 100.0;
  double health_percent = 100.0;
  double distance = 0.0;        // m
  std::uint32_t coins = 0;      // this run
  double elapsed = 0.0;         // s
  double target_distance = 0.0;
  RunStatus status = RunStatus::Running;
};

// Single consistent view of a session after a frame's steps.
struct FrameSnapshot {
  CarSnapshot prev{};           // state before the last fixed step
  CarSnapshot car{};            // state after the last fixed step
  double alpha = 0.0;           // leftover fraction of a step, for interpolation
  HudSnapshot hud{};
  RunStats stats{};             // run totals, shown when the run ends
  std::vector<Vec2> ground;     // surface samples around the car, ordered by x
  std::vector<Coin> coins;      // uncollected, near the car
  std::vector<FuelCan> fuel_cans;
  std::vector<Hazard> hazards;
  std::string level_name;
  std::uint64_t tick = 0;       // fixed steps taken this run
};

} // namespace hcr
