#pragma once
#include <cstddef>
#include <cstdint>
#include <rcat/frames.hpp>
#include <rcat/ticker.hpp>

namespace rcat {

class DisplaySurface;

inline constexpr int kDefaultAnimateIntervalMs = 200;

// Cycles a frame cursor through the active FrameSet and pushes each frame to
// the display surface. Pacing comes from a single owned Ticker.
class Animator {
public:
  explicit Animator(DisplaySurface& surface, int interval_ms = kDefaultAnimateIntervalMs);
  Animator(const Animator&) = delete;
  Animator& operator=(const Animator&) = delete;

  void start(std::int64_t now_ms);
  void stop();

  // stop -> set interval -> start. The cursor is left where it was.
  void retune(int interval_ms, std::int64_t now_ms);

  // Runs on_tick() once per due period.
  void poll(std::int64_t now_ms);

  // Push frames[cursor] and advance. No-op on an empty set; a cursor left
  // out of range by a shorter rebuild restarts at 0.
  void on_tick();

  // Replaces the frame set; the cursor is clamped lazily at the next tick.
  void set_frames(FrameSet frames);

  const FrameSet& frames() const { return frames_; }
  std::size_t cursor() const { return cursor_; }
  int interval_ms() const { return ticker_.interval_ms(); }
  bool running() const { return ticker_.running(); }

private:
  DisplaySurface& surface_;
  Ticker ticker_;
  FrameSet frames_;
  std::size_t cursor_{0};
};

} // namespace rcat
