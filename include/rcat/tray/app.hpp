#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <rcat/menu.hpp>
#include <rcat/surface.hpp>

namespace rcat {

class AutostartStore;
class Indicator;

// raylib front-end: a small borderless always-on-top window acting as the
// status indicator. Shows the current frame (also as the window icon), the
// load tooltip on hover, a right-click menu, and opens a task manager on
// double-click.
class TrayApp : public DisplaySurface {
public:
  TrayApp(std::string title, std::string version_label);
  ~TrayApp() override;
  TrayApp(const TrayApp&) = delete;
  TrayApp& operator=(const TrayApp&) = delete;

  // Opens the window and drives the indicator until Exit or window close.
  // The indicator is stopped before the window goes away. Returns 0 on normal exit.
  int run(Indicator& indicator, AutostartStore& autostart, const std::string& exe_path);

  void show_frame(const Frame& frame) override;
  void set_tooltip(const std::string& text) override { tooltip_ = text; }

  const std::string& tooltip() const { return tooltip_; }

private:
  struct SpriteCache; // raylib images/textures, defined in app.cpp

  void process_input_(Indicator& indicator, AutostartStore& autostart, const std::string& exe_path);
  void render_frame_(const Indicator& indicator);
  void draw_menu_();
  void open_menu_(const Indicator& indicator, const AutostartStore& autostart);
  void close_menu_();
  static void open_task_manager_();
  static std::int64_t now_ms_();

  std::string title_;
  std::string version_label_;
  std::unique_ptr<SpriteCache> sprites_;
  std::string current_key_;
  std::string tooltip_;

  // Menu
  std::vector<MenuItem> menu_;
  bool menu_open_{false};
  int hover_row_{-1};

  // Double-click detection (seconds, raylib clock)
  double last_click_s_{-1.0};
  bool exit_requested_{false};
};

} // namespace rcat
