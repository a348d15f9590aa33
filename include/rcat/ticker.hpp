#pragma once
#include <cstdint>

namespace rcat {

// Periodic timer polled from the event loop with a monotonic millisecond clock.
// Never fires on its own; poll() reports how many periods elapsed.
class Ticker {
public:
  explicit Ticker(int interval_ms);

  void start(std::int64_t now_ms);   // no-op if already running
  void stop();
  void retune(int interval_ms, std::int64_t now_ms);

  // Number of fires due at now_ms (0 when stopped). Keeps cadence with
  // next += interval; if the loop stalled for more than kMaxCatchUp periods
  // the schedule restarts from now instead of bursting.
  int poll(std::int64_t now_ms);

  bool running() const { return running_; }
  int interval_ms() const { return interval_ms_; }
  std::int64_t next_due_ms() const { return next_due_ms_; }

  static constexpr int kMaxCatchUp = 4;

private:
  static int sane_(int interval_ms) { return interval_ms < 1 ? 1 : interval_ms; }

  int interval_ms_;
  bool running_{false};
  std::int64_t next_due_ms_{0};
};

} // namespace rcat
