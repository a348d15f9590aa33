#pragma once
#include <optional>
#include <string>

namespace rcat {

inline constexpr const char* kProductName = "RunCat";

// User-scoped run-on-login registration.
class AutostartStore {
public:
  virtual ~AutostartStore() = default;
  // Asks the OS every time; never cached.
  virtual bool is_enabled() const = 0;
  virtual bool enable(const std::string& exe_path) = 0;
  virtual bool disable() = 0;
};

// XDG autostart: <dir>/<name>.desktop
class XdgAutostartStore : public AutostartStore {
public:
  XdgAutostartStore(std::string dir, std::string name = kProductName);

  bool is_enabled() const override;
  bool enable(const std::string& exe_path) override;
  bool disable() override;

  const std::string& entry_path() const { return entry_path_; }

private:
  std::string dir_;
  std::string name_;
  std::string entry_path_;
};

// <config home>/autostart
std::string default_autostart_dir();

// /proc/self/exe, nullopt if unreadable.
std::optional<std::string> current_executable_path();

} // namespace rcat
