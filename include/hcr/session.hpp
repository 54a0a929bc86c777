#pragma once
#include <memory>
#include <optional>
#include <vector>
#include <hcr/car.hpp>
#include <hcr/collision_events.hpp>
#include <hcr/events.hpp>
#include <hcr/level.hpp>
#include <hcr/physics_stepper.hpp>
#include <hcr/snapshot.hpp>
#include <hcr/telemetry.hpp>
#include <hcr/terrain.hpp>

namespace hcr {

class GameSession;

struct LevelStart {
  std::unique_ptr<GameSession> session;  // null when error is set
  std::optional<ConfigError> error;
};

// Everything one run owns: terrain, car, stepper, event detector, telemetry
// and the pending event queue. Created at level start; a restart builds a new one.
class GameSession {
  // Only start() can name this, so every session is validated first.
  struct Passkey { explicit Passkey() = default; };

public:
  static constexpr double kSpawnX = 10.0;
  static constexpr double kStallSpeed = 0.2;   // m/s
  static constexpr double kStallTime = 1.5;    // s out of fuel and at rest

  // Validates the level before anything is simulated.
  static LevelStart start(const LevelParams& level, const CarParams& car = {});

  GameSession(Passkey, const LevelParams& level, const CarParams& car);

  GameSession(const GameSession&) = delete;
  GameSession& operator=(const GameSession&) = delete;

  // Runs the fixed steps due for this much real time; returns how many ran.
  int advance(double frame_dt, const DriverInput& input);
  void step_once(const DriverInput& input);

  std::vector<GameEvent> drain_events();

  const CarModel& car() const { return car_; }
  CarModel& car() { return car_; }
  const TerrainGenerator& terrain() const { return terrain_; }
  const PhysicsStepper& stepper() const { return stepper_; }
  const CollisionEvents& events() const { return events_; }
  const RunTelemetry& telemetry() const { return telemetry_; }
  const LevelParams& params() const { return level_; }

  RunStatus status() const { return status_; }
  bool frozen() const { return status_ == RunStatus::Crashed || status_ == RunStatus::Stalled; }
  double elapsed() const { return elapsed_; }

  HudSnapshot hud() const;
  FrameSnapshot snapshot() const;

private:
  void update_status_(const StepReport& rep);
  CarSnapshot car_snapshot_() const;

  LevelParams level_;
  TerrainGenerator terrain_;
  CarModel car_;
  PhysicsStepper stepper_;
  CollisionEvents events_;
  RunTelemetry telemetry_;

  std::vector<GameEvent> pending_;
  RunStatus status_{RunStatus::Running};
  double elapsed_{0.0};
  double stall_time_{0.0};
  CarSnapshot prev_{};
};

} // namespace hcr
