#pragma once
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <rcat/options.hpp>

namespace rcat {

// OS light/dark appearance with a change notification.
class AppearanceSource {
public:
  using Callback = std::function<void()>;

  virtual ~AppearanceSource() = default;

  // Light or Dark. Implementations answer Light when the setting is unreadable.
  virtual Theme current_theme() const = 0;

  // Re-probe the OS; fires subscribers when the answer changed.
  virtual void refresh() = 0;

  int subscribe(Callback on_change);
  void unsubscribe(int token);

protected:
  void notify_();

private:
  std::map<int, Callback> subscribers_;
  int next_token_{1};
};

// Reads a GTK settings.ini stream. Returns nullopt if it says nothing about
// dark/light preference.
std::optional<Theme> theme_from_gtk_settings(std::istream& in);

// GTK_THEME value such as "Adwaita:dark" or "Arc-Dark".
std::optional<Theme> theme_from_gtk_theme_name(const std::string& name);

// GSettings color-scheme value such as "'prefer-dark'". nullopt for
// 'default' and anything unknown: no preference.
std::optional<Theme> theme_from_color_scheme(const std::string& value);

// Raw org.gnome.desktop.interface color-scheme value; nullopt if unavailable.
using ColorSchemeReader = std::function<std::optional<std::string>()>;

// Asks the gsettings tool. nullopt when it is missing or fails.
std::optional<std::string> gsettings_color_scheme();

// Probe order: a dark GTK_THEME, the color-scheme preference,
// gtk-4.0/settings.ini, gtk-3.0/settings.ini; Light if none decides.
class GtkAppearanceSource : public AppearanceSource {
public:
  // Empty config_home means $XDG_CONFIG_HOME, else $HOME/.config.
  explicit GtkAppearanceSource(std::string config_home = {},
                               ColorSchemeReader color_scheme = gsettings_color_scheme);

  Theme current_theme() const override { return theme_; }
  void refresh() override;

  Theme probe() const;

private:
  std::string config_home_;
  ColorSchemeReader color_scheme_;
  Theme theme_{Theme::Light};
};

// $XDG_CONFIG_HOME or $HOME/.config; empty when neither is set.
std::string config_home_dir();

} // namespace rcat
