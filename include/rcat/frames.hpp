#pragma once
#include <optional>
#include <string>
#include <vector>
#include <rcat/options.hpp>

namespace rcat {

class AppearanceSource;

struct Frame {
  std::string key;   // e.g. "dark_cat_3"
  std::string path;  // where the image lives; empty for in-memory stores

  bool operator==(const Frame&) const = default;
};

using FrameSet = std::vector<Frame>;

// Image lookup by frame key.
class AssetStore {
public:
  virtual ~AssetStore() = default;
  virtual std::optional<Frame> find(const std::string& key) const = 0;
};

// Frames stored as <dir>/<key><ext> on disk.
class DirectoryAssetStore : public AssetStore {
public:
  explicit DirectoryAssetStore(std::string dir, std::string ext = ".png");
  std::optional<Frame> find(const std::string& key) const override;
  const std::string& dir() const { return dir_; }

private:
  std::string dir_;
  std::string ext_;
};

// System -> whatever the probe reports (Light if it cannot tell); others verbatim.
Theme resolve_theme(Theme selected, const AppearanceSource& appearance);

// "{theme}_{runner}_{index}", lower case. `theme` must already be resolved.
std::string frame_key(Theme theme, Runner runner, int index);

// Frames 0..frame_count(runner)-1 in order. Indices with no asset are skipped,
// so the result may be shorter than the runner's frame count.
FrameSet resolve_frame_set(Runner runner, Theme theme, const AppearanceSource& appearance,
                           const AssetStore& assets);

} // namespace rcat
