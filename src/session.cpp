#include <hcr/session.hpp>
#include <algorithm>
#include <iterator>
#include <memory>

namespace hcr {

namespace {

constexpr double kOverlayBehind = 40.0;  // m kept in the snapshot behind the car
constexpr double kOverlayAhead = 80.0;
constexpr double kGroundStep = 1.0;

} // namespace

const char* run_status_name(RunStatus s) {
  switch (s) {
    case RunStatus::Running:   return "Running";
    case RunStatus::Crashed:   return "Crashed";
    case RunStatus::Stalled:   return "Stalled";
    case RunStatus::Completed: return "Completed";
  }
  return "Unknown";
}

LevelStart GameSession::start(const LevelParams& level, const CarParams& car) {
  LevelStart out{};
  if (auto err = validate_level_params(level)) {
    out.error = *err;
    return out;
  }
  auto s = std::make_unique<GameSession>(Passkey{}, level, car);
  if (!s->terrain_.healthy()) {
    out.error = ConfigError{"seed", "terrain generation produced non-finite heights"};
    return out;
  }
  out.session = std::move(s);
  return out;
}

GameSession::GameSession(Passkey, const LevelParams& level, const CarParams& car)
  : level_(level),
    terrain_(level.seed, level.difficulty),
    car_(car, level.upgrades),
    stepper_(stepper_params_for(level)),
    events_(EventParams{.target_distance = level.target_distance}) {
  car_.place(kSpawnX, terrain_, stepper_.params().gravity);
  stepper_.reset(car_.state().position.x);
  prev_ = car_snapshot_();
}

int GameSession::advance(double frame_dt, const DriverInput& input) {
  if (frozen()) return 0;
  const int due = stepper_.schedule(frame_dt);
  int ran = 0;
  for (; ran < due && !frozen(); ++ran) step_once(input);
  return ran;
}

void GameSession::step_once(const DriverInput& input) {
  if (frozen()) return;
  prev_ = car_snapshot_();
  car_.apply_input(input);

  const StepReport rep = stepper_.step(car_, terrain_);
  elapsed_ += stepper_.params().dt;

  std::vector<GameEvent> step_events;
  events_.update(car_, terrain_, rep, elapsed_, step_events);
  telemetry_.update(car_, rep, step_events, stepper_.params().dt);
  update_status_(rep);

  pending_.insert(pending_.end(), std::make_move_iterator(step_events.begin()),
                  std::make_move_iterator(step_events.end()));
}

void GameSession::update_status_(const StepReport& rep) {
  const auto& s = car_.state();
  if (events_.crashed()) {
    status_ = RunStatus::Crashed;
    return;
  }
  if (s.fuel_empty && rep.supported && car_.speed() < kStallSpeed) {
    stall_time_ += stepper_.params().dt;
    if (stall_time_ >= kStallTime) {
      status_ = RunStatus::Stalled;
      return;
    }
  } else {
    stall_time_ = 0.0;
  }
  if (events_.completed()) status_ = RunStatus::Completed;
}

std::vector<GameEvent> GameSession::drain_events() {
  std::vector<GameEvent> out;
  out.swap(pending_);
  return out;
}

CarSnapshot GameSession::car_snapshot_() const {
  const auto& s = car_.state();
  CarSnapshot c{};
  c.x = s.position.x;
  c.y = s.position.y;
  c.angle = s.angle;
  for (std::size_t i = 0; i < c.wheels.size(); ++i) {
    const auto& ws = car_.wheels()[i].state();
    c.wheels[i] = WheelPose{ws.center.x, ws.center.y, ws.spin, ws.compression, ws.contact};
  }
  return c;
}

HudSnapshot GameSession::hud() const {
  const auto& s = car_.state();
  HudSnapshot h{};
  h.speed = car_.speed();
  h.fuel_percent = s.fuel;
  h.health_percent = s.health;
  h.distance = s.distance;
  h.coins = s.coins_collected;
  h.elapsed = elapsed_;
  h.target_distance = level_.target_distance;
  h.status = status_;
  return h;
}

FrameSnapshot GameSession::snapshot() const {
  FrameSnapshot f{};
  f.prev = prev_;
  f.car = car_snapshot_();
  f.alpha = stepper_.alpha();
  f.hud = hud();
  f.stats = telemetry_.stats();
  f.level_name = level_.name;
  f.tick = stepper_.steps();

  const double x = car_.state().position.x;
  const double x0 = std::max(0.0, x - kOverlayBehind);
  for (double gx = x0; gx <= x + kOverlayAhead; gx += kGroundStep) {
    f.ground.push_back({gx, terrain_.height_at(gx)});
  }
  for (const auto& c : terrain_.coins_between(x - kOverlayBehind, x + kOverlayAhead)) {
    if (!events_.coin_taken(c.id)) f.coins.push_back(c);
  }
  for (const auto& fc : terrain_.fuel_cans_between(x - kOverlayBehind, x + kOverlayAhead)) {
    if (!events_.can_taken(fc.id)) f.fuel_cans.push_back(fc);
  }
  f.hazards = terrain_.hazards_between(x - kOverlayBehind, x + kOverlayAhead);
  return f;
}

} // namespace hcr
