#pragma once
#include <string>
#include <vector>
#include <rcat/options.hpp>

namespace rcat {

class AutostartStore;
class Indicator;

enum class MenuAction {
  None,          // headers, version line
  SelectRunner,
  SelectTheme,
  SelectFpsMaxLimit,
  ToggleStartup,
  Exit
};

struct MenuItem {
  std::string label;
  MenuAction action = MenuAction::None;
  int value = 0;         // enum value for Select* actions
  bool checked = false;
  bool enabled = true;
  bool header = false;   // section title, not clickable
};

// Runner / Theme / FPS Max Limit sections, Startup, version, Exit.
std::vector<MenuItem> build_menu(const OptionState& options, bool startup_enabled,
                                 const std::string& version_label);

enum class MenuOutcome {
  Handled,
  Failed,        // the autostart entry could not be written/removed
  Exit
};

// Applies a clicked item. The startup toggle decides enable vs disable from
// the store itself, not from the item's checked flag.
MenuOutcome apply_menu_item(const MenuItem& item, Indicator& indicator, AutostartStore& autostart,
                            const std::string& exe_path);

} // namespace rcat
