#include <rcat/frames.hpp>
#include <rcat/appearance.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace rcat {

DirectoryAssetStore::DirectoryAssetStore(std::string dir, std::string ext)
  : dir_(std::move(dir)), ext_(std::move(ext)) {}

std::optional<Frame> DirectoryAssetStore::find(const std::string& key) const {
  const std::filesystem::path p = std::filesystem::path(dir_) / (key + ext_);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) return std::nullopt;
  return Frame{key, p.string()};
}

Theme resolve_theme(Theme selected, const AppearanceSource& appearance) {
  if (selected != Theme::System) return selected;
  const Theme probed = appearance.current_theme();
  return probed == Theme::Dark ? Theme::Dark : Theme::Light;
}

std::string frame_key(Theme theme, Runner runner, int index) {
  std::string key = std::string(info(theme).asset) + "_" + info(runner).asset + "_" + std::to_string(index);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return key;
}

FrameSet resolve_frame_set(Runner runner, Theme theme, const AppearanceSource& appearance,
                           const AssetStore& assets) {
  const Theme resolved = resolve_theme(theme, appearance);
  const int n = frame_count(runner);
  FrameSet out;
  out.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    if (auto f = assets.find(frame_key(resolved, runner, i)); f.has_value()) {
      out.push_back(std::move(*f));
    }
  }
  return out;
}

} // namespace rcat
