#include <rcat/load_driver.hpp>
#include <rcat/animator.hpp>
#include <rcat/load.hpp>
#include <rcat/speed.hpp>
#include <rcat/surface.hpp>
#include <cstdio>

namespace rcat {

std::string format_load_tooltip(float load) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "CPU: %.1f%%", static_cast<double>(load));
  return std::string(buf);
}

LoadDriver::LoadDriver(LoadSampler& sampler, Animator& animator, DisplaySurface& surface,
                       const OptionState& options, int interval_ms)
  : sampler_(sampler), animator_(animator), surface_(surface),
    options_(options), ticker_(interval_ms) {}

void LoadDriver::start(std::int64_t now_ms) { ticker_.start(now_ms); }

void LoadDriver::stop() { ticker_.stop(); }

void LoadDriver::poll(std::int64_t now_ms) {
  // Several missed periods still need only one fresh sample.
  if (ticker_.poll(now_ms) > 0) on_tick(now_ms);
}

void LoadDriver::on_tick(std::int64_t now_ms) {
  last_load_ = sampler_.sample();
  surface_.set_tooltip(format_load_tooltip(last_load_));
  animator_.retune(rcat::interval_ms(last_load_, options_.fps_max_limit), now_ms);
}

} // namespace rcat
