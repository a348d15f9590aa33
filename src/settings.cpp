#include <rcat/settings.hpp>
#include <rcat/appearance.hpp> // config_home_dir
#include <rcat/text.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace rcat {

OptionState options_from_stream(std::istream& in) {
  OptionState o{};
  std::string line;
  while (std::getline(in, line)) {
    auto kv = split_key_value(line);
    if (!kv) continue;
    const auto& [key, value] = *kv;
    if (key == kRunnerKey) {
      if (auto v = runner_from_key(value)) o.runner = *v;
    } else if (key == kThemeKey) {
      if (auto v = theme_from_key(value)) o.theme = *v;
    } else if (key == kFpsMaxLimitKey) {
      if (auto v = fps_max_limit_from_key(value)) o.fps_max_limit = *v;
    }
  }
  return o;
}

void options_to_stream(std::ostream& out, const OptionState& o) {
  out << kRunnerKey << '=' << info(o.runner).key << '\n';
  out << kThemeKey << '=' << info(o.theme).key << '\n';
  out << kFpsMaxLimitKey << '=' << info(o.fps_max_limit).key << '\n';
}

FileSettingsStore::FileSettingsStore(std::string path) : path_(std::move(path)) {}

OptionState FileSettingsStore::load() {
  std::ifstream f(path_);
  if (!f) return OptionState{};
  return options_from_stream(f);
}

bool FileSettingsStore::save(const OptionState& o) {
  const std::filesystem::path p(path_);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) return false;
  }
  std::ofstream f(path_, std::ios::trunc);
  if (!f) return false;
  options_to_stream(f, o);
  f.flush();
  return static_cast<bool>(f);
}

std::string default_settings_path() {
  const std::string home = config_home_dir();
  if (home.empty()) return "settings.ini";
  return home + "/rcat/settings.ini";
}

} // namespace rcat
