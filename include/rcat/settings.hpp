#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <rcat/options.hpp>

namespace rcat {

// Persisted key names.
inline constexpr const char* kRunnerKey = "Runner";
inline constexpr const char* kThemeKey = "Theme";
inline constexpr const char* kFpsMaxLimitKey = "FPSMaxLimit";

// Flat "key=value" reader. Each key falls back to its OptionState default on
// its own when missing or unparseable; unknown keys are ignored.
OptionState options_from_stream(std::istream& in);
void options_to_stream(std::ostream& out, const OptionState& o);

class SettingsStore {
public:
  virtual ~SettingsStore() = default;
  virtual OptionState load() = 0;
  virtual bool save(const OptionState& o) = 0;
};

class FileSettingsStore : public SettingsStore {
public:
  explicit FileSettingsStore(std::string path);

  // Defaults if the file does not exist.
  OptionState load() override;
  // Creates parent directories; false if the file cannot be written.
  bool save(const OptionState& o) override;

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// <config home>/rcat/settings.ini; relative "settings.ini" without a home.
std::string default_settings_path();

} // namespace rcat
