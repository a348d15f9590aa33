#pragma once
#include <cstdint>
#include <rcat/animator.hpp>
#include <rcat/load.hpp>
#include <rcat/load_driver.hpp>
#include <rcat/options.hpp>
#include <rcat/ticker.hpp>

namespace rcat {

class AppearanceSource;
class AssetStore;
class DisplaySurface;
class SettingsStore;

inline constexpr int kAppearancePollMs = 2000;

// The load-driven animation engine. Owns the option state, the sampler and
// both drivers; everything OS-bound is borrowed and must outlive it.
// All calls happen on the single event-loop thread.
class Indicator {
public:
  // Loads options, takes the counter warm-up read, resolves the first frame set.
  Indicator(LoadSource& load, AppearanceSource& appearance, const AssetStore& assets,
            DisplaySurface& surface, SettingsStore& settings);
  ~Indicator();
  Indicator(const Indicator&) = delete;
  Indicator& operator=(const Indicator&) = delete;

  // Shows frame 0 and "0.0%", starts all tickers.
  void start(std::int64_t now_ms);
  void poll(std::int64_t now_ms);
  void stop();
  // stop() then save options. Runs once; later calls are no-ops.
  bool shutdown();

  // Menu events. Runner/theme rebuild frames now; the max rate is picked up
  // at the next load tick.
  void set_runner(Runner r);
  void set_theme(Theme t);
  void set_fps_max_limit(FpsMaxLimit f);

  // OS appearance changed; only matters while the theme is System.
  void on_appearance_changed();

  const OptionState& options() const { return options_; }
  const Animator& animator() const { return animator_; }
  const LoadDriver& load_driver() const { return load_driver_; }
  // Light or Dark as currently rendered.
  Theme rendered_theme() const;

private:
  void rebuild_frames_();

  AppearanceSource& appearance_;
  const AssetStore& assets_;
  DisplaySurface& surface_;
  SettingsStore& settings_;

  OptionState options_;
  LoadSampler sampler_;
  Animator animator_;
  LoadDriver load_driver_;
  Ticker appearance_ticker_{kAppearancePollMs};
  int appearance_token_{0};
  bool shut_down_{false};
};

} // namespace rcat
