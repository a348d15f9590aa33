#pragma once
#include <cstdint>
#include <string>
#include <rcat/options.hpp>
#include <rcat/ticker.hpp>

namespace rcat {

class Animator;
class DisplaySurface;
class LoadSampler;

inline constexpr int kLoadIntervalMs = 5000;

// "CPU: 12.3%"
std::string format_load_tooltip(float load);

// Slow ticker: sample load -> tooltip -> retune the animator.
class LoadDriver {
public:
  // `options` is read on every tick so max-rate changes apply at the next one.
  LoadDriver(LoadSampler& sampler, Animator& animator, DisplaySurface& surface,
             const OptionState& options, int interval_ms = kLoadIntervalMs);

  void start(std::int64_t now_ms);
  void stop();
  void poll(std::int64_t now_ms);
  void on_tick(std::int64_t now_ms);

  float last_load() const { return last_load_; }
  bool running() const { return ticker_.running(); }
  int interval_ms() const { return ticker_.interval_ms(); }

private:
  LoadSampler& sampler_;
  Animator& animator_;
  DisplaySurface& surface_;
  const OptionState& options_;
  Ticker ticker_;
  float last_load_{0.0f};
};

} // namespace rcat
