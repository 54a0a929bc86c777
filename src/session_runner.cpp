#include <hcr/session_runner.hpp>
#include <algorithm>
#include <string>
#include <utility>

namespace hcr {

SessionRunner::SessionRunner() : SessionRunner(level_catalog()) {}

SessionRunner::SessionRunner(std::vector<LevelParams> catalog) : catalog_(std::move(catalog)) {}

bool SessionRunner::start_level(std::size_t index) {
  ++starts_;
  session_.reset();
  if (index >= catalog_.size()) {
    last_error_ = ConfigError{"level", "no level at index " + std::to_string(index)};
    return false;
  }
  level_index_ = index;

  LevelParams level = catalog_[index];
  level.upgrades = multipliers_from_levels(upgrade_levels_);
  auto started = GameSession::start(level);
  if (started.error) {
    last_error_ = started.error;
    return false;
  }
  last_error_.reset();
  session_ = std::move(started.session);
  publish_();
  return true;
}

void SessionRunner::request_restart() {
  pending_restart_ = true;
}

void SessionRunner::request_level(std::size_t index) {
  pending_level_ = index;
}

void SessionRunner::set_upgrade_levels(const UpgradeLevels& levels) {
  upgrade_levels_ = levels;
}

void SessionRunner::apply_pending_() {
  if (pending_level_) {
    const std::size_t idx = *pending_level_;
    pending_level_.reset();
    pending_restart_ = false;
    start_level(idx);
  } else if (pending_restart_) {
    pending_restart_ = false;
    start_level(level_index_);
  }
}

int SessionRunner::frame(double real_dt, const DriverInput& input) {
  apply_pending_();
  if (!session_) return 0;

  const double scale = std::max(0.0, time_scale);
  const int ran = session_->advance(real_dt * scale, input);

  const auto events = session_->drain_events();
  if (sink_ && !events.empty()) {
    const HudSnapshot hud = session_->hud();
    for (const auto& e : events) sink_->on_event(e, hud);
  }

  // Publish even when paused so readers keep seeing the sequence move.
  publish_();
  return ran;
}

void SessionRunner::publish_() {
  if (session_) buffer_.publish(session_->snapshot());
}

} // namespace hcr
