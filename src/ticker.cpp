#include <rcat/ticker.hpp>

namespace rcat {

Ticker::Ticker(int interval_ms) : interval_ms_(sane_(interval_ms)) {}

void Ticker::start(std::int64_t now_ms) {
  if (running_) return;
  running_ = true;
  next_due_ms_ = now_ms + interval_ms_;
}

void Ticker::stop() {
  running_ = false;
}

void Ticker::retune(int interval_ms, std::int64_t now_ms) {
  stop();
  interval_ms_ = sane_(interval_ms);
  start(now_ms);
}

int Ticker::poll(std::int64_t now_ms) {
  if (!running_) return 0;
  int fires = 0;
  while (now_ms >= next_due_ms_) {
    ++fires;
    next_due_ms_ += interval_ms_;
    if (fires > kMaxCatchUp) {
      // Stalled (suspend, debugger); drop the backlog.
      fires = 1;
      next_due_ms_ = now_ms + interval_ms_;
      break;
    }
  }
  return fires;
}

} // namespace rcat
