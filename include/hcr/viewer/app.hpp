#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <hcr/car.hpp>
#include <hcr/session_runner.hpp>
#include <hcr/snapshot.hpp>

namespace hcr {

// RAII application that drives the runner, renders the latest snapshot and
// logs gameplay events through raylib's TraceLog.
class ViewerApp : public EventSink {
public:
  explicit ViewerApp(SessionRunner& runner);
  int run(); // returns 0 on normal exit

  void on_event(const GameEvent& ev, const HudSnapshot& hud) override;

private:
  // Input & data flow
  void process_input_();
  void pump_snapshot_();
  // Rendering
  void render_frame_();
  void draw_terrain_(const FrameSnapshot& snap);
  void draw_overlay_(const FrameSnapshot& snap);
  void draw_car_(const CarSnapshot& car);
  void draw_hud_(const FrameSnapshot& snap);
  void draw_run_summary_(const RunStats& stats, int y);
  void draw_toasts_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f world_to_screen_(double x, double y) const;
  double ground_y_(const FrameSnapshot& snap, double x) const;
  void log_level_start_();

  // Dependencies
  SessionRunner& runner_;

  DriverInput input_{};
  FrameSnapshot snap_{};
  std::uint64_t cursor_{0};
  std::uint64_t logged_starts_{0};

  // Camera (meters)
  float scale_px_per_m_{28.0f};
  double cam_x_{0.0};
  double cam_y_{0.0};

  struct Toast { std::string text; double ttl; };
  std::deque<Toast> toasts_;
};

} // namespace hcr
