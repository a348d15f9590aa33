#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rcat {

enum class Runner : int {
  Cat = 0,
  Parrot = 1,
  Horse = 2,
  Count
};

enum class Theme : int {
  System = 0, // resolved through the appearance probe at render time
  Light = 1,
  Dark = 2,
  Count
};

enum class FpsMaxLimit : int {
  FPS40 = 0,
  FPS30 = 1,
  FPS20 = 2,
  FPS10 = 3,
  Count
};

// Table rows. `key` is what gets persisted and must never change;
// `label` is free to change with the menu wording.
struct RunnerInfo {
  Runner value;
  const char* key;
  const char* label;
  const char* asset;   // file name fragment
  int frames;          // frames per animation cycle
};

struct ThemeInfo {
  Theme value;
  const char* key;
  const char* label;
  const char* asset;   // empty for System (never rendered directly)
};

struct FpsMaxLimitInfo {
  FpsMaxLimit value;
  const char* key;
  const char* label;
  float rate;          // multiplier applied to load/5
};

const std::vector<RunnerInfo>& runner_table();
const std::vector<ThemeInfo>& theme_table();
const std::vector<FpsMaxLimitInfo>& fps_max_limit_table();

const RunnerInfo& info(Runner r);
const ThemeInfo& info(Theme t);
const FpsMaxLimitInfo& info(FpsMaxLimit f);

// Persisted key -> value. Exact, case-sensitive match.
std::optional<Runner> runner_from_key(std::string_view key);
std::optional<Theme> theme_from_key(std::string_view key);
std::optional<FpsMaxLimit> fps_max_limit_from_key(std::string_view key);

inline int frame_count(Runner r) { return info(r).frames; }
inline float rate_multiplier(FpsMaxLimit f) { return info(f).rate; }

struct OptionState {
  Runner runner = Runner::Cat;
  Theme theme = Theme::System;
  FpsMaxLimit fps_max_limit = FpsMaxLimit::FPS40;

  bool operator==(const OptionState&) const = default;
};

} // namespace rcat
