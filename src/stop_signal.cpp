#include <rcat/stop_signal.hpp>
#include <csignal>

namespace rcat {

static volatile std::sig_atomic_t g_stop_signal = 0;

static void on_stop_signal(int signum) {
  g_stop_signal = signum;
}

void install_stop_signal_handlers() {
  std::signal(SIGTERM, on_stop_signal);
  std::signal(SIGHUP, on_stop_signal);  // session end / terminal closed
  std::signal(SIGINT, on_stop_signal);
}

bool stop_requested() { return g_stop_signal != 0; }

int stop_signal() { return static_cast<int>(g_stop_signal); }

void clear_stop_request() { g_stop_signal = 0; }

} // namespace rcat
