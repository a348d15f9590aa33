#include <rcat/options.hpp>
#include <algorithm>

namespace rcat {

static std::vector<RunnerInfo> make_runner_table() {
  return {
    {Runner::Cat,    "Cat",    "Cat",    "cat",    5},
    {Runner::Parrot, "Parrot", "Parrot", "parrot", 10},
    {Runner::Horse,  "Horse",  "Horse",  "horse",  14},
  };
}

static std::vector<ThemeInfo> make_theme_table() {
  return {
    {Theme::System, "System", "System", ""},
    {Theme::Light,  "Light",  "Light",  "light"},
    {Theme::Dark,   "Dark",   "Dark",   "dark"},
  };
}

static std::vector<FpsMaxLimitInfo> make_fps_max_limit_table() {
  return {
    {FpsMaxLimit::FPS40, "FPS40", "40fps", 1.0f},
    {FpsMaxLimit::FPS30, "FPS30", "30fps", 0.75f},
    {FpsMaxLimit::FPS20, "FPS20", "20fps", 0.5f},
    {FpsMaxLimit::FPS10, "FPS10", "10fps", 0.25f},
  };
}

const std::vector<RunnerInfo>& runner_table() {
  static const std::vector<RunnerInfo> t = make_runner_table();
  return t;
}

const std::vector<ThemeInfo>& theme_table() {
  static const std::vector<ThemeInfo> t = make_theme_table();
  return t;
}

const std::vector<FpsMaxLimitInfo>& fps_max_limit_table() {
  static const std::vector<FpsMaxLimitInfo> t = make_fps_max_limit_table();
  return t;
}

// Tables are ordered by enum value; out-of-range values fall back to row 0.
template <class Row, class E>
static const Row& row_for(const std::vector<Row>& table, E v) {
  const auto i = static_cast<std::size_t>(v);
  return i < table.size() ? table[i] : table.front();
}

template <class Row>
static auto value_for(const std::vector<Row>& table, std::string_view key)
    -> std::optional<decltype(Row::value)> {
  auto it = std::find_if(table.begin(), table.end(),
                         [&](const Row& r){ return key == r.key; });
  if (it == table.end()) return std::nullopt;
  return it->value;
}

const RunnerInfo& info(Runner r) { return row_for(runner_table(), r); }
const ThemeInfo& info(Theme t) { return row_for(theme_table(), t); }
const FpsMaxLimitInfo& info(FpsMaxLimit f) { return row_for(fps_max_limit_table(), f); }

std::optional<Runner> runner_from_key(std::string_view key) {
  return value_for(runner_table(), key);
}

std::optional<Theme> theme_from_key(std::string_view key) {
  return value_for(theme_table(), key);
}

std::optional<FpsMaxLimit> fps_max_limit_from_key(std::string_view key) {
  return value_for(fps_max_limit_table(), key);
}

} // namespace rcat
