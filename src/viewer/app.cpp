#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

#include <hcr/viewer/app.hpp>
#include <hcr/events.hpp>
#include <hcr/interp.hpp>

namespace hcr {

namespace {

static constexpr double kRadToDeg = 180.0 / kPI;
static constexpr int kMaxUpgradeLevel = 8;
static constexpr double kToastSeconds = 2.5;
static constexpr std::size_t kMaxToasts = 6;

static const char* warp_label(double w) {
  if (w == 0.0) return "Paused";
  if (w == 1.0) return "1x";
  return "custom";
}

// Body shape in the chassis frame (m); matches CarParams defaults.
static constexpr float kBodyHalfLen = 1.3f;
static constexpr float kBodyHalfHeight = 0.35f;
static constexpr float kCabinW = 1.3f, kCabinH = 0.5f;
static constexpr float kCabinX = -0.15f, kCabinY = 0.6f;
static constexpr float kWheelRadius = 0.4f;

static Color status_color(RunStatus s) {
  switch (s) {
    case RunStatus::Running:   return Color{220, 235, 220, 255};
    case RunStatus::Crashed:   return Color{235, 80, 70, 255};
    case RunStatus::Stalled:   return Color{240, 180, 60, 255};
    case RunStatus::Completed: return Color{90, 220, 120, 255};
  }
  return RAYWHITE;
}

static void draw_bar(int x, int y, int w, int h, double pct, Color fill, const char* label) {
  const double p = std::clamp(pct, 0.0, 100.0) / 100.0;
  DrawRectangle(x - 2, y - 2, w + 4, h + 4, Color{0, 0, 0, 120});
  DrawRectangle(x, y, int(w * p), h, fill);
  DrawText(TextFormat("%s %3.0f%%", label, pct), x + 6, y + 2, h - 4, RAYWHITE);
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(SessionRunner& runner) : runner_(runner) {
  runner_.set_sink(this);
}

ViewerApp::Vec2f ViewerApp::world_to_screen_(double x, double y) const {
  const float ox = GetScreenWidth() * 0.33f;
  const float oy = GetScreenHeight() * 0.6f;
  return { ox + float((x - cam_x_) * scale_px_per_m_), oy - float((y - cam_y_) * scale_px_per_m_) };
}

double ViewerApp::ground_y_(const FrameSnapshot& snap, double x) const {
  const auto& g = snap.ground;
  if (g.empty()) return 0.0;
  auto it = std::lower_bound(g.begin(), g.end(), x, [](const Vec2& p, double v){ return p.x < v; });
  if (it == g.begin()) return it->y;
  if (it == g.end()) return g.back().y;
  const auto& b = *it;
  const auto& a = *(it - 1);
  const double t = (b.x > a.x) ? (x - a.x) / (b.x - a.x) : 0.0;
  return lerp(a.y, b.y, t);
}

void ViewerApp::log_level_start_() {
  if (const auto& err = runner_.last_error()) {
    TraceLog(LOG_WARNING, "HCR: level start failed: %s: %s", err->field.c_str(), err->message.c_str());
    return;
  }
  if (const auto* s = runner_.session()) {
    const auto& p = s->params();
    TraceLog(LOG_INFO, "HCR: level '%s' (%s) seed=%u target=%.0fm",
             p.name.c_str(), tier_name(p.difficulty), static_cast<unsigned>(p.seed), p.target_distance);
  }
}

void ViewerApp::on_event(const GameEvent& ev, const HudSnapshot& hud) {
  const std::string text = describe_event(ev);
  TraceLog(LOG_INFO, "HCR: t=%.2fs x=%.1fm %s", hud.elapsed, hud.distance, text.c_str());
  toasts_.push_back(Toast{text, kToastSeconds});
  while (toasts_.size() > kMaxToasts) toasts_.pop_front();
}

int ViewerApp::run() {
  const int W = 1280, H = 720;
  InitWindow(W, H, "Hill Climb");
  SetTargetFPS(144);

  while (!WindowShouldClose()) {
    process_input_();
    runner_.frame(GetFrameTime(), input_);
    pump_snapshot_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  input_.accelerate  = IsKeyDown(KEY_W) || IsKeyDown(KEY_UP);
  input_.brake       = IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN);
  input_.steer_left  = IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT);
  input_.steer_right = IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT);

  if (IsKeyPressed(KEY_SPACE) || IsKeyPressed(KEY_P)) {
    runner_.time_scale = (runner_.time_scale == 0.0) ? 1.0 : 0.0;
  }

  // Zoom
  if (IsKeyDown(KEY_KP_ADD) || IsKeyDown(KEY_EQUAL))      scale_px_per_m_ = std::min(80.0f, scale_px_per_m_ * 1.01f);
  if (IsKeyDown(KEY_KP_SUBTRACT) || IsKeyDown(KEY_MINUS)) scale_px_per_m_ = std::max(8.0f, scale_px_per_m_ * 0.99f);

  bool restart = IsKeyPressed(KEY_R);

  // Level select 1..5
  const int level_keys[] = {KEY_ONE, KEY_TWO, KEY_THREE, KEY_FOUR, KEY_FIVE};
  for (int i = 0; i < 5; ++i) {
    if (IsKeyPressed(level_keys[i]) && std::size_t(i) < runner_.catalog().size()) {
      runner_.request_level(std::size_t(i));
      restart = false;
      toasts_.clear();
    }
  }

  // Upgrade levels cycle 0..kMaxUpgradeLevel; applied on restart.
  const int upgrade_keys[] = {KEY_Z, KEY_X, KEY_C, KEY_V, KEY_B};
  auto levels = runner_.upgrade_levels();
  bool changed = false;
  for (std::size_t i = 0; i < kUpgradeKindCount; ++i) {
    if (!IsKeyPressed(upgrade_keys[i])) continue;
    levels[i] = (levels[i] + 1) % (kMaxUpgradeLevel + 1);
    changed = true;
    TraceLog(LOG_INFO, "HCR: upgrade %s -> level %d",
             upgrade_name(static_cast<UpgradeKind>(i)), levels[i]);
  }
  if (changed) {
    runner_.set_upgrade_levels(levels);
    restart = true;
  }

  if (restart) {
    runner_.request_restart();
    toasts_.clear();
  }
}

void ViewerApp::pump_snapshot_() {
  runner_.buffer().try_consume_latest(cursor_, snap_);
  if (runner_.start_count() != logged_starts_) {
    logged_starts_ = runner_.start_count();
    log_level_start_();
  }
}

void ViewerApp::render_frame_() {
  const CarSnapshot car = interpolate(snap_.prev, snap_.car, snap_.alpha);

  // Camera follows the car, easing vertically.
  cam_x_ = car.x;
  cam_y_ += (car.y - cam_y_) * 0.1;

  BeginDrawing();
  ClearBackground(Color{135, 190, 235, 255});

  if (runner_.session()) {
    draw_terrain_(snap_);
    draw_overlay_(snap_);
    draw_car_(car);
    draw_hud_(snap_);
  } else if (const auto& err = runner_.last_error()) {
    DrawText(TextFormat("Level start failed: %s: %s", err->field.c_str(), err->message.c_str()),
             20, 20, 20, Color{235, 80, 70, 255});
  }
  draw_toasts_();
  EndDrawing();

  const float dt = GetFrameTime();
  for (auto& t : toasts_) t.ttl -= dt;
  while (!toasts_.empty() && toasts_.front().ttl <= 0.0) toasts_.pop_front();
}

void ViewerApp::draw_terrain_(const FrameSnapshot& snap) {
  const auto& g = snap.ground;
  if (g.size() < 2) return;
  const float bottom = float(GetScreenHeight());

  for (std::size_t i = 1; i < g.size(); ++i) {
    const auto a = world_to_screen_(g[i-1].x, g[i-1].y);
    const auto b = world_to_screen_(g[i].x, g[i].y);
    const Vector2 top_l{a.x, a.y}, top_r{b.x, b.y};
    const Vector2 bot_l{a.x, bottom}, bot_r{b.x, bottom};
    DrawTriangle(top_l, bot_l, bot_r, Color{120, 85, 50, 255});
    DrawTriangle(top_l, bot_r, top_r, Color{120, 85, 50, 255});
    DrawLineEx(top_l, top_r, 6.0f, Color{70, 160, 60, 255});
  }

  // Distance markers every 50 m
  const double first = std::ceil(g.front().x / 50.0) * 50.0;
  for (double x = first; x <= g.back().x; x += 50.0) {
    const auto p = world_to_screen_(x, ground_y_(snap, x));
    DrawLineEx({p.x, p.y}, {p.x, p.y - 40.0f}, 2.0f, Color{250, 250, 250, 180});
    DrawText(TextFormat("%.0fm", x), int(p.x) + 4, int(p.y) - 40, 14, RAYWHITE);
  }
}

void ViewerApp::draw_overlay_(const FrameSnapshot& snap) {
  const float s = scale_px_per_m_;
  for (const auto& h : snap.hazards) {
    const auto a = world_to_screen_(h.x_begin, ground_y_(snap, h.x_begin));
    const auto b = world_to_screen_(h.x_end, ground_y_(snap, h.x_end));
    if (h.kind == HazardKind::Boost) {
      DrawLineEx({a.x, a.y}, {b.x, b.y}, 8.0f, Color{40, 200, 230, 255});
      continue;
    }
    const int teeth = std::max(2, int((h.x_end - h.x_begin) / 0.5));
    for (int i = 0; i < teeth; ++i) {
      const double x0 = h.x_begin + (h.x_end - h.x_begin) * i / teeth;
      const double x1 = h.x_begin + (h.x_end - h.x_begin) * (i + 1) / teeth;
      const auto p0 = world_to_screen_(x0, ground_y_(snap, x0));
      const auto p1 = world_to_screen_(x1, ground_y_(snap, x1));
      const Vector2 tip{(p0.x + p1.x) * 0.5f, (p0.y + p1.y) * 0.5f - 0.5f * s};
      DrawTriangle({p0.x, p0.y}, {p1.x, p1.y}, tip, Color{150, 150, 160, 255});
    }
  }
  for (const auto& c : snap.coins) {
    const auto p = world_to_screen_(c.position.x, c.position.y);
    DrawCircleV({p.x, p.y}, 0.35f * s, Color{245, 200, 40, 255});
    DrawCircleLines(int(p.x), int(p.y), 0.35f * s, Color{180, 130, 20, 255});
  }
  for (const auto& f : snap.fuel_cans) {
    const auto p = world_to_screen_(f.position.x, f.position.y);
    DrawRectangleV({p.x - 0.3f * s, p.y - 0.4f * s}, {0.6f * s, 0.8f * s}, Color{210, 50, 40, 255});
    DrawText("F", int(p.x - 0.15f * s), int(p.y - 0.3f * s), int(0.6f * s), RAYWHITE);
  }
}

void ViewerApp::draw_car_(const CarSnapshot& car) {
  const float s = scale_px_per_m_;
  const auto c = world_to_screen_(car.x, car.y);
  const float rot = float(-car.angle * kRadToDeg);

  // Suspension struts
  for (const auto& w : car.wheels) {
    const auto hub = world_to_screen_(w.x, w.y);
    DrawLineEx({c.x, c.y}, {hub.x, hub.y}, 3.0f, Color{60, 60, 70, 255});
  }

  Rectangle body{c.x, c.y, 2.0f * kBodyHalfLen * s, 2.0f * kBodyHalfHeight * s};
  DrawRectanglePro(body, {kBodyHalfLen * s, kBodyHalfHeight * s}, rot, Color{215, 50, 45, 255});

  // Cabin rotates about the chassis center.
  Rectangle cabin{c.x, c.y, kCabinW * s, kCabinH * s};
  const Vector2 origin{0.5f * kCabinW * s - kCabinX * s, 0.5f * kCabinH * s + kCabinY * s};
  DrawRectanglePro(cabin, origin, rot, Color{240, 240, 245, 255});

  for (const auto& w : car.wheels) {
    const auto hub = world_to_screen_(w.x, w.y);
    const float r = kWheelRadius * s;
    DrawCircleV({hub.x, hub.y}, r, Color{30, 30, 34, 255});
    DrawCircleV({hub.x, hub.y}, r * 0.45f, Color{170, 170, 180, 255});
    const float sa = std::sin(float(w.spin)), ca = std::cos(float(w.spin));
    DrawLineEx({hub.x - ca * r, hub.y + sa * r}, {hub.x + ca * r, hub.y - sa * r}, 2.0f, Color{90, 90, 100, 255});
  }
}

void ViewerApp::draw_hud_(const FrameSnapshot& snap) {
  const auto& h = snap.hud;
  draw_bar(20, 20, 240, 22, h.fuel_percent, Color{230, 150, 30, 255}, "Fuel");
  draw_bar(20, 50, 240, 22, h.health_percent, Color{200, 60, 60, 255}, "Health");

  DrawText(TextFormat("%s  %.0f / %.0f m  coins=%u  %.0f km/h  t=%.1fs  %s",
                      snap.level_name.c_str(), h.distance, h.target_distance,
                      static_cast<unsigned>(h.coins), h.speed * 3.6, h.elapsed,
                      warp_label(runner_.time_scale)),
           280, 22, 20, Color{20, 30, 40, 255});

  DrawText(run_status_name(h.status), 280, 50, 20, status_color(h.status));

  const auto& lv = runner_.upgrade_levels();
  DrawText(TextFormat("Upgrades  acc=%d  speed=%d  traction=%d  fuel=%d  susp=%d",
                      lv[0], lv[1], lv[2], lv[3], lv[4]),
           20, 84, 16, Color{20, 30, 40, 255});

  DrawText("W/Up: Gas | S/Down: Brake | A/D: Tilt | R: Restart | 1..5: Level | Space/P: Pause | Z X C V B: Upgrades | +/-: Zoom",
           20, GetScreenHeight() - 24, 14, Color{240, 240, 240, 255});

  if (h.status == RunStatus::Crashed || h.status == RunStatus::Stalled) {
    const char* msg = h.status == RunStatus::Crashed ? "CRASHED - press R" : "OUT OF FUEL - press R";
    const int w = MeasureText(msg, 40);
    DrawText(msg, (GetScreenWidth() - w) / 2, GetScreenHeight() / 3, 40, status_color(h.status));
    draw_run_summary_(snap.stats, GetScreenHeight() / 3 + 56);
  } else if (h.status == RunStatus::Completed) {
    draw_run_summary_(snap.stats, 116);
  }
}

void ViewerApp::draw_run_summary_(const RunStats& st, int y) {
  auto line = [&y](const char* text) {
    const int w = MeasureText(text, 20);
    DrawText(text, (GetScreenWidth() - w) / 2, y, 20, Color{20, 30, 40, 255});
    y += 26;
  };
  line(TextFormat("Distance %.0f m in %.1f s   top speed %.0f km/h", st.distance, st.elapsed, st.top_speed * 3.6));
  line(TextFormat("Air %.1f s (longest %.1f s)   flips %u", st.airtime_total, st.longest_air,
                  static_cast<unsigned>(st.flips)));
  line(TextFormat("Coins %u   fuel cans %u   hazards %u", static_cast<unsigned>(st.coins),
                  static_cast<unsigned>(st.fuel_cans), static_cast<unsigned>(st.hazards)));
  line(TextFormat("Damage taken %.0f   fuel used %.1f", st.damage_taken, st.fuel_used));
}

void ViewerApp::draw_toasts_() {
  int y = 20;
  const int x = GetScreenWidth() - 320;
  for (const auto& t : toasts_) {
    const unsigned char a = static_cast<unsigned char>(std::clamp(t.ttl / kToastSeconds, 0.0, 1.0) * 220.0);
    DrawRectangle(x - 8, y - 4, 300, 24, Color{0, 0, 0, static_cast<unsigned char>(a / 2)});
    DrawText(t.text.c_str(), x, y, 16, Color{255, 255, 255, a});
    y += 28;
  }
}

} // namespace hcr
