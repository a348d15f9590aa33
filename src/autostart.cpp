#include <rcat/autostart.hpp>
#include <rcat/appearance.hpp> // config_home_dir
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace rcat {

XdgAutostartStore::XdgAutostartStore(std::string dir, std::string name)
  : dir_(std::move(dir)), name_(std::move(name)),
    entry_path_((fs::path(dir_) / (name_ + ".desktop")).string()) {}

bool XdgAutostartStore::is_enabled() const {
  std::error_code ec;
  return fs::exists(entry_path_, ec);
}

bool XdgAutostartStore::enable(const std::string& exe_path) {
  if (exe_path.empty()) return false;
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) return false;

  std::ofstream f(entry_path_, std::ios::trunc);
  if (!f) return false;
  f << "[Desktop Entry]\n"
    << "Type=Application\n"
    << "Name=" << name_ << "\n"
    << "Exec=\"" << exe_path << "\"\n"
    << "X-GNOME-Autostart-enabled=true\n";
  f.flush();
  return static_cast<bool>(f);
}

bool XdgAutostartStore::disable() {
  std::error_code ec;
  fs::remove(entry_path_, ec); // false (not an error) when already absent
  return !ec;
}

std::string default_autostart_dir() {
  const std::string home = config_home_dir();
  return home.empty() ? std::string("autostart") : home + "/autostart";
}

std::optional<std::string> current_executable_path() {
  std::error_code ec;
  const auto p = fs::read_symlink("/proc/self/exe", ec);
  if (ec || p.empty()) return std::nullopt;
  return p.string();
}

} // namespace rcat
