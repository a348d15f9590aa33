#pragma once
#include <string>
#include <rcat/frames.hpp>

namespace rcat {

// Where the indicator is shown (tray icon, window, test recorder).
class DisplaySurface {
public:
  virtual ~DisplaySurface() = default;
  virtual void show_frame(const Frame& frame) = 0;
  virtual void set_tooltip(const std::string& text) = 0;
};

} // namespace rcat
