#include <rcat/animator.hpp>
#include <rcat/surface.hpp>

namespace rcat {

Animator::Animator(DisplaySurface& surface, int interval_ms)
  : surface_(surface), ticker_(interval_ms) {}

void Animator::start(std::int64_t now_ms) { ticker_.start(now_ms); }

void Animator::stop() { ticker_.stop(); }

void Animator::retune(int interval_ms, std::int64_t now_ms) {
  ticker_.retune(interval_ms, now_ms);
}

void Animator::poll(std::int64_t now_ms) {
  const int fires = ticker_.poll(now_ms);
  for (int i = 0; i < fires; ++i) on_tick();
}

void Animator::on_tick() {
  if (frames_.empty()) return;
  if (cursor_ >= frames_.size()) cursor_ = 0;
  surface_.show_frame(frames_[cursor_]);
  cursor_ = (cursor_ + 1) % frames_.size();
}

void Animator::set_frames(FrameSet frames) {
  frames_ = std::move(frames);
}

} // namespace rcat
