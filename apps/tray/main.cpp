#include <raylib.h>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include <rcat/appearance.hpp>
#include <rcat/autostart.hpp>
#include <rcat/frames.hpp>
#include <rcat/indicator.hpp>
#include <rcat/instance_lock.hpp>
#include <rcat/load.hpp>
#include <rcat/settings.hpp>
#include <rcat/stop_signal.hpp>
#include <rcat/tray/app.hpp>

#ifndef RCAT_VERSION
#define RCAT_VERSION "0.0.0"
#endif

using namespace rcat;

static int log_level_from_env() {
  const char* v = std::getenv("RCAT_LOG_LEVEL");
  if (!v) return LOG_INFO;
  const std::string s(v);
  if (s == "debug")   return LOG_DEBUG;
  if (s == "warning") return LOG_WARNING;
  if (s == "error")   return LOG_ERROR;
  return LOG_INFO;
}

// $RCAT_ASSETS, else "assets" beside the executable, else ./assets
static std::string asset_dir(const std::string& exe_path) {
  if (const char* env = std::getenv("RCAT_ASSETS"); env && *env) return env;
  if (!exe_path.empty()) {
    return (std::filesystem::path(exe_path).parent_path() / "assets").string();
  }
  return "assets";
}

int main() {
  SetTraceLogLevel(log_level_from_env());

  InstanceLock lock(default_lock_path());
  if (!lock.acquired()) return 0; // another indicator is running
  install_stop_signal_handlers();

  std::unique_ptr<ProcStatLoadSource> cpu;
  try {
    cpu = std::make_unique<ProcStatLoadSource>();
  } catch (const std::runtime_error& e) {
    TraceLog(LOG_ERROR, "RCAT: %s", e.what());
    return 1;
  }

  const std::string exe = current_executable_path().value_or("");
  const std::string version = std::string(kProductName) + " v" + RCAT_VERSION;

  GtkAppearanceSource appearance;
  DirectoryAssetStore assets(asset_dir(exe));
  FileSettingsStore settings(default_settings_path());
  XdgAutostartStore autostart(default_autostart_dir());
  TrayApp app(kProductName, version);

  Indicator indicator(*cpu, appearance, assets, app, settings);
  TraceLog(LOG_INFO, "RCAT: %s runner=%s theme=%s limit=%s assets=%s",
           version.c_str(),
           info(indicator.options().runner).key,
           info(indicator.options().theme).key,
           info(indicator.options().fps_max_limit).key,
           assets.dir().c_str());

  const int code = app.run(indicator, autostart, exe);

  if (!indicator.shutdown()) {
    TraceLog(LOG_WARNING, "RCAT: could not save settings to %s", settings.path().c_str());
  }
  return code;
}
