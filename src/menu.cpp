#include <rcat/menu.hpp>
#include <rcat/autostart.hpp>
#include <rcat/indicator.hpp>

namespace rcat {

static MenuItem header(const char* title) {
  MenuItem m;
  m.label = title;
  m.enabled = false;
  m.header = true;
  return m;
}

static MenuItem choice(const char* label, MenuAction action, int value, bool checked) {
  MenuItem m;
  m.label = label;
  m.action = action;
  m.value = value;
  m.checked = checked;
  return m;
}

std::vector<MenuItem> build_menu(const OptionState& options, bool startup_enabled,
                                 const std::string& version_label) {
  std::vector<MenuItem> items;

  items.push_back(header("Runner"));
  for (const auto& r : runner_table()) {
    items.push_back(choice(r.label, MenuAction::SelectRunner,
                           static_cast<int>(r.value), r.value == options.runner));
  }

  items.push_back(header("Theme"));
  for (const auto& t : theme_table()) {
    items.push_back(choice(t.label, MenuAction::SelectTheme,
                           static_cast<int>(t.value), t.value == options.theme));
  }

  items.push_back(header("FPS Max Limit"));
  for (const auto& f : fps_max_limit_table()) {
    items.push_back(choice(f.label, MenuAction::SelectFpsMaxLimit,
                           static_cast<int>(f.value), f.value == options.fps_max_limit));
  }

  items.push_back(choice("Startup", MenuAction::ToggleStartup, 0, startup_enabled));

  MenuItem version;
  version.label = version_label;
  version.enabled = false;
  items.push_back(version);

  items.push_back(choice("Exit", MenuAction::Exit, 0, false));
  return items;
}

MenuOutcome apply_menu_item(const MenuItem& item, Indicator& indicator, AutostartStore& autostart,
                            const std::string& exe_path) {
  if (!item.enabled) return MenuOutcome::Handled;
  switch (item.action) {
    case MenuAction::SelectRunner:
      if (item.value >= 0 && item.value < static_cast<int>(Runner::Count))
        indicator.set_runner(static_cast<Runner>(item.value));
      return MenuOutcome::Handled;
    case MenuAction::SelectTheme:
      if (item.value >= 0 && item.value < static_cast<int>(Theme::Count))
        indicator.set_theme(static_cast<Theme>(item.value));
      return MenuOutcome::Handled;
    case MenuAction::SelectFpsMaxLimit:
      if (item.value >= 0 && item.value < static_cast<int>(FpsMaxLimit::Count))
        indicator.set_fps_max_limit(static_cast<FpsMaxLimit>(item.value));
      return MenuOutcome::Handled;
    case MenuAction::ToggleStartup: {
      const bool ok = autostart.is_enabled() ? autostart.disable() : autostart.enable(exe_path);
      return ok ? MenuOutcome::Handled : MenuOutcome::Failed;
    }
    case MenuAction::Exit:
      return MenuOutcome::Exit;
    case MenuAction::None:
      return MenuOutcome::Handled;
  }
  return MenuOutcome::Handled; // out-of-range value cast into MenuAction
}

} // namespace rcat
