#include <rcat/appearance.hpp>
#include <rcat/text.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace rcat {

int AppearanceSource::subscribe(Callback on_change) {
  const int token = next_token_++;
  subscribers_.emplace(token, std::move(on_change));
  return token;
}

void AppearanceSource::unsubscribe(int token) {
  subscribers_.erase(token);
}

void AppearanceSource::notify_() {
  // Copy: a callback may unsubscribe itself.
  const auto subs = subscribers_;
  for (const auto& [token, cb] : subs) {
    if (cb) cb();
  }
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::optional<Theme> theme_from_gtk_theme_name(const std::string& name) {
  const std::string n = lower(trim(name));
  if (n.empty()) return std::nullopt;
  // "Adwaita:dark" (variant suffix) or "Arc-Dark" / "Yaru-dark" (theme name)
  if (n.find(":dark") != std::string::npos) return Theme::Dark;
  if (n.find("-dark") != std::string::npos || n.find("_dark") != std::string::npos) return Theme::Dark;
  return Theme::Light;
}

std::optional<Theme> theme_from_gtk_settings(std::istream& in) {
  std::optional<Theme> by_name;
  std::optional<Theme> by_pref;
  std::string line;
  while (std::getline(in, line)) {
    auto kv = split_key_value(line);
    if (!kv) continue;
    const auto& [key, value] = *kv;
    if (key == "gtk-application-prefer-dark-theme") {
      const std::string v = lower(value);
      if (v == "1" || v == "true") by_pref = Theme::Dark;
      else if (v == "0" || v == "false") by_pref = Theme::Light;
    } else if (key == "gtk-theme-name") {
      by_name = theme_from_gtk_theme_name(value);
    }
  }
  // An explicit dark preference wins over a light theme name.
  if (by_pref == Theme::Dark || by_name == Theme::Dark) return Theme::Dark;
  if (by_pref) return by_pref;
  return by_name;
}

std::optional<Theme> theme_from_color_scheme(const std::string& value) {
  std::string v = trim(value);
  if (v.size() >= 2 && v.front() == '\'' && v.back() == '\'') v = v.substr(1, v.size() - 2);
  if (v == "prefer-dark") return Theme::Dark;
  if (v == "prefer-light") return Theme::Light;
  return std::nullopt;
}

std::optional<std::string> gsettings_color_scheme() {
  FILE* p = ::popen("gsettings get org.gnome.desktop.interface color-scheme 2>/dev/null", "r");
  if (!p) return std::nullopt;
  std::string out;
  std::array<char, 128> buf{};
  while (std::fgets(buf.data(), static_cast<int>(buf.size()), p)) out += buf.data();
  const int rc = ::pclose(p);
  if (rc != 0 || out.empty()) return std::nullopt;
  return trim(out);
}

std::string config_home_dir() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) return xdg;
  if (const char* home = std::getenv("HOME"); home && *home) return std::string(home) + "/.config";
  return {};
}

GtkAppearanceSource::GtkAppearanceSource(std::string config_home, ColorSchemeReader color_scheme)
  : config_home_(config_home.empty() ? config_home_dir() : std::move(config_home)),
    color_scheme_(std::move(color_scheme)) {
  theme_ = probe();
}

Theme GtkAppearanceSource::probe() const {
  // A light GTK_THEME is only the widget theme; it does not override the
  // desktop preference below.
  if (const char* env = std::getenv("GTK_THEME"); env && *env) {
    if (theme_from_gtk_theme_name(env) == Theme::Dark) return Theme::Dark;
  }
  if (color_scheme_) {
    if (auto raw = color_scheme_()) {
      if (auto t = theme_from_color_scheme(*raw)) return *t;
    }
  }
  if (!config_home_.empty()) {
    for (const char* rel : {"/gtk-4.0/settings.ini", "/gtk-3.0/settings.ini"}) {
      std::ifstream f(config_home_ + rel);
      if (!f) continue;
      if (auto t = theme_from_gtk_settings(f)) return *t;
    }
  }
  return Theme::Light;
}

void GtkAppearanceSource::refresh() {
  const Theme now = probe();
  if (now == theme_) return;
  theme_ = now;
  notify_();
}

} // namespace rcat
