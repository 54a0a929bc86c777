#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <hcr/level.hpp>
#include <hcr/session.hpp>
#include <hcr/snap_buffer.hpp>
#include <hcr/upgrades.hpp>

namespace hcr {

// Receives gameplay events after the frame's steps, with the HUD at that point.
struct EventSink {
  virtual ~EventSink() = default;
  virtual void on_event(const GameEvent& ev, const HudSnapshot& hud) = 0;
};

// Cooperative frame driver: owns the current session, applies restart and
// level requests between frames, advances by scaled real time and publishes
// one complete snapshot per frame.
class SessionRunner {
public:
  SessionRunner();  // built-in catalog
  explicit SessionRunner(std::vector<LevelParams> catalog);
  SessionRunner(const SessionRunner&) = delete;
  SessionRunner& operator=(const SessionRunner&) = delete;

  // Starts immediately. On failure the previous session is dropped and
  // last_error() says why.
  bool start_level(std::size_t index);

  // Applied at the start of the next frame().
  void request_restart();
  void request_level(std::size_t index);
  void set_upgrade_levels(const UpgradeLevels& levels);  // takes effect on restart

  void set_sink(EventSink* sink) { sink_ = sink; }

  // Returns the number of fixed steps run.
  int frame(double real_dt, const DriverInput& input);

  SnapshotBuffer& buffer() { return buffer_; }
  const SnapshotBuffer& buffer() const { return buffer_; }

  const GameSession* session() const { return session_.get(); }
  GameSession* session() { return session_.get(); }
  const std::vector<LevelParams>& catalog() const { return catalog_; }
  std::size_t level_index() const { return level_index_; }
  const UpgradeLevels& upgrade_levels() const { return upgrade_levels_; }
  const std::optional<ConfigError>& last_error() const { return last_error_; }
  std::uint64_t start_count() const { return starts_; }  // attempts, successful or not

  // Control surface
  double time_scale{1.0};  // 0.0 = paused

private:
  void apply_pending_();
  void publish_();

  std::vector<LevelParams> catalog_;
  std::size_t level_index_{0};
  UpgradeLevels upgrade_levels_{};
  std::unique_ptr<GameSession> session_;
  std::optional<ConfigError> last_error_;
  std::uint64_t starts_{0};
  SnapshotBuffer buffer_;
  EventSink* sink_{nullptr};

  bool pending_restart_{false};
  std::optional<std::size_t> pending_level_;
};

} // namespace hcr
