#include <raylib.h>
#include <chrono>
#include <cstdlib>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include <rcat/tray/app.hpp>
#include <rcat/autostart.hpp>
#include <rcat/indicator.hpp>
#include <rcat/options.hpp>
#include <rcat/stop_signal.hpp>

namespace rcat {

namespace {

// --- Layout (pixels) ---
static constexpr int kIconPx      = 64;
static constexpr int kMenuWidth   = 180;
static constexpr int kMenuRowH    = 20;
static constexpr int kMenuFont    = 14;
static constexpr int kTooltipFont = 10;

static constexpr double kDoubleClickS = 0.40;

static Color background_for(Theme rendered) {
  return rendered == Theme::Dark ? Color{32, 33, 36, 255} : Color{240, 240, 240, 255};
}

static Color foreground_for(Theme rendered) {
  return rendered == Theme::Dark ? Color{230, 230, 230, 255} : Color{30, 30, 30, 255};
}

} // namespace

struct TrayApp::SpriteCache {
  struct Sprite {
    Image image{};        // kept for SetWindowIcon
    Texture2D texture{};
  };

  std::unordered_map<std::string, Sprite> loaded; // by frame key
  std::unordered_set<std::string> failed;         // logged once, never retried

  const Sprite* get(const Frame& f) {
    if (auto it = loaded.find(f.key); it != loaded.end()) return &it->second;
    if (failed.count(f.key)) return nullptr;

    Image img = LoadImage(f.path.c_str());
    if (img.data == nullptr) {
      TraceLog(LOG_WARNING, "RCAT: could not load frame image %s", f.path.c_str());
      failed.insert(f.key);
      return nullptr;
    }
    ImageFormat(&img, PIXELFORMAT_UNCOMPRESSED_R8G8B8A8); // window icons need RGBA8
    Sprite s;
    s.image = img;
    s.texture = LoadTextureFromImage(img);
    SetTextureFilter(s.texture, TEXTURE_FILTER_BILINEAR);
    return &loaded.emplace(f.key, s).first->second;
  }

  // GPU resources; must run while the window is still open.
  void clear() {
    for (auto& [key, s] : loaded) {
      UnloadTexture(s.texture);
      UnloadImage(s.image);
    }
    loaded.clear();
    failed.clear();
  }

  ~SpriteCache() {
    if (!loaded.empty() && IsWindowReady()) clear();
  }
};

TrayApp::TrayApp(std::string title, std::string version_label)
  : title_(std::move(title)), version_label_(std::move(version_label)),
    sprites_(std::make_unique<SpriteCache>()) {}

TrayApp::~TrayApp() = default;

std::int64_t TrayApp::now_ms_() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

void TrayApp::show_frame(const Frame& frame) {
  current_key_ = frame.key;
  if (!IsWindowReady()) return;
  if (const auto* s = sprites_->get(frame)) SetWindowIcon(s->image);
}

int TrayApp::run(Indicator& indicator, AutostartStore& autostart, const std::string& exe_path) {
  SetConfigFlags(FLAG_WINDOW_UNDECORATED | FLAG_WINDOW_TOPMOST | FLAG_MSAA_4X_HINT);
  InitWindow(kIconPx, kIconPx, title_.c_str());
  if (!IsWindowReady()) {
    TraceLog(LOG_ERROR, "RCAT: could not open the indicator window");
    return 1;
  }
  SetExitKey(KEY_NULL); // Esc closes the menu, not the app
  SetTargetFPS(60);

  if (indicator.animator().frames().empty()) {
    TraceLog(LOG_WARNING, "RCAT: no frames found for runner %s; indicator stays blank",
             info(indicator.options().runner).label);
  }

  indicator.start(now_ms_());

  while (!WindowShouldClose() && !exit_requested_ && !stop_requested()) {
    process_input_(indicator, autostart, exe_path);
    indicator.poll(now_ms_());
    render_frame_(indicator);
  }
  if (stop_requested()) TraceLog(LOG_INFO, "RCAT: stopping on signal %d", stop_signal());

  indicator.stop();
  sprites_->clear();
  CloseWindow();
  return 0;
}

void TrayApp::process_input_(Indicator& indicator, AutostartStore& autostart,
                             const std::string& exe_path) {
  if (menu_open_) {
    const Vector2 m = GetMousePosition();
    hover_row_ = IsCursorOnScreen() ? static_cast<int>(m.y) / kMenuRowH : -1;
    if (hover_row_ >= static_cast<int>(menu_.size())) hover_row_ = -1;

    if (IsKeyPressed(KEY_ESCAPE) || IsMouseButtonPressed(MOUSE_BUTTON_RIGHT)) {
      close_menu_();
      return;
    }
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT) && hover_row_ >= 0) {
      const MenuItem& item = menu_[static_cast<std::size_t>(hover_row_)];
      if (!item.enabled) return; // headers and the version line stay open
      switch (apply_menu_item(item, indicator, autostart, exe_path)) {
        case MenuOutcome::Exit:
          TraceLog(LOG_INFO, "RCAT: exit requested from menu");
          exit_requested_ = true;
          break;
        case MenuOutcome::Failed:
          TraceLog(LOG_WARNING, "RCAT: could not update autostart entry");
          break;
        case MenuOutcome::Handled:
          break;
      }
      close_menu_();
    }
    return;
  }

  if (IsMouseButtonPressed(MOUSE_BUTTON_RIGHT)) {
    open_menu_(indicator, autostart);
    return;
  }

  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    const double t = GetTime();
    if (last_click_s_ >= 0.0 && t - last_click_s_ <= kDoubleClickS) {
      open_task_manager_();
      last_click_s_ = -1.0;
    } else {
      last_click_s_ = t;
    }
  }
}

void TrayApp::open_menu_(const Indicator& indicator, const AutostartStore& autostart) {
  // Startup state is read from the OS each time the menu opens.
  menu_ = build_menu(indicator.options(), autostart.is_enabled(), version_label_);
  menu_open_ = true;
  hover_row_ = -1;
  SetWindowSize(kMenuWidth, kMenuRowH * static_cast<int>(menu_.size()));
}

void TrayApp::close_menu_() {
  menu_open_ = false;
  menu_.clear();
  hover_row_ = -1;
  SetWindowSize(kIconPx, kIconPx);
}

void TrayApp::render_frame_(const Indicator& indicator) {
  const Theme rendered = indicator.rendered_theme();

  BeginDrawing();
  ClearBackground(background_for(rendered));

  if (menu_open_) {
    draw_menu_();
    EndDrawing();
    return;
  }

  if (auto it = sprites_->loaded.find(current_key_); it != sprites_->loaded.end()) {
    const Texture2D& tex = it->second.texture;
    const Rectangle src{0.0f, 0.0f, float(tex.width), float(tex.height)};
    const Rectangle dst{0.0f, 0.0f, float(GetScreenWidth()), float(GetScreenHeight())};
    DrawTexturePro(tex, src, dst, Vector2{0.0f, 0.0f}, 0.0f, WHITE);
  }

  // Tooltip while hovered
  if (IsCursorOnScreen() && !tooltip_.empty()) {
    const int w = MeasureText(tooltip_.c_str(), kTooltipFont);
    const int y = GetScreenHeight() - kTooltipFont - 4;
    DrawRectangle(0, y - 2, GetScreenWidth(), kTooltipFont + 6, Color{0, 0, 0, 160});
    DrawText(tooltip_.c_str(), (GetScreenWidth() - w) / 2, y, kTooltipFont, RAYWHITE);
  }
  EndDrawing();
}

void TrayApp::draw_menu_() {
  const Color fg = foreground_for(Theme::Light);
  const Color dim{150, 150, 150, 255};
  const Color hl{200, 220, 250, 255};

  DrawRectangle(0, 0, GetScreenWidth(), GetScreenHeight(), Color{248, 248, 248, 255});
  for (std::size_t i = 0; i < menu_.size(); ++i) {
    const MenuItem& item = menu_[i];
    const int y = static_cast<int>(i) * kMenuRowH;

    if (static_cast<int>(i) == hover_row_ && item.enabled) {
      DrawRectangle(0, y, GetScreenWidth(), kMenuRowH, hl);
    }
    if (item.header) {
      DrawLine(0, y, GetScreenWidth(), y, Color{210, 210, 210, 255});
      DrawText(item.label.c_str(), 6, y + 3, kMenuFont, dim);
      continue;
    }
    if (item.checked) DrawText("*", 10, y + 3, kMenuFont, fg);
    DrawText(item.label.c_str(), 24, y + 3, kMenuFont, item.enabled ? fg : dim);
  }
}

void TrayApp::open_task_manager_() {
  // Backgrounded subshell: returns at once, whichever helper exists wins.
  const char* cmd =
    "(gnome-system-monitor || plasma-systemmonitor || xfce4-taskmanager"
    " || x-terminal-emulator -e top) >/dev/null 2>&1 &";
  const int rc = std::system(cmd);
  if (rc != 0) TraceLog(LOG_DEBUG, "RCAT: task manager helper exited with %d", rc);
}

} // namespace rcat
