#include <rcat/indicator.hpp>
#include <rcat/appearance.hpp>
#include <rcat/frames.hpp>
#include <rcat/settings.hpp>
#include <rcat/surface.hpp>

namespace rcat {

Indicator::Indicator(LoadSource& load, AppearanceSource& appearance, const AssetStore& assets,
                     DisplaySurface& surface, SettingsStore& settings)
  : appearance_(appearance), assets_(assets), surface_(surface), settings_(settings),
    options_(settings.load()),
    sampler_(load),
    animator_(surface),
    load_driver_(sampler_, animator_, surface, options_) {
  rebuild_frames_();
  appearance_token_ = appearance_.subscribe([this]{ on_appearance_changed(); });
}

Indicator::~Indicator() {
  appearance_.unsubscribe(appearance_token_);
}

void Indicator::start(std::int64_t now_ms) {
  if (!animator_.frames().empty()) surface_.show_frame(animator_.frames().front());
  surface_.set_tooltip("0.0%");
  animator_.start(now_ms);
  load_driver_.start(now_ms);
  appearance_ticker_.start(now_ms);
}

void Indicator::poll(std::int64_t now_ms) {
  if (appearance_ticker_.poll(now_ms) > 0) appearance_.refresh();
  load_driver_.poll(now_ms);
  animator_.poll(now_ms);
}

void Indicator::stop() {
  appearance_ticker_.stop();
  load_driver_.stop();
  animator_.stop();
}

bool Indicator::shutdown() {
  if (shut_down_) return true;
  shut_down_ = true;
  stop();
  return settings_.save(options_);
}

void Indicator::set_runner(Runner r) {
  options_.runner = r;
  rebuild_frames_();
}

void Indicator::set_theme(Theme t) {
  options_.theme = t;
  rebuild_frames_();
}

void Indicator::set_fps_max_limit(FpsMaxLimit f) {
  options_.fps_max_limit = f;
}

void Indicator::on_appearance_changed() {
  if (options_.theme == Theme::System) rebuild_frames_();
}

Theme Indicator::rendered_theme() const {
  return resolve_theme(options_.theme, appearance_);
}

void Indicator::rebuild_frames_() {
  animator_.set_frames(resolve_frame_set(options_.runner, options_.theme, appearance_, assets_));
}

} // namespace rcat
