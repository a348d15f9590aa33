#include <catch2/catch_test_macros.hpp>
#include <rcat/frames.hpp>
#include "fakes.hpp"

using namespace rcat;
using namespace rcat::test;

static std::vector<std::string> keys_of(const FrameSet& fs) {
  std::vector<std::string> out;
  for (const auto& f : fs) out.push_back(f.key);
  return out;
}

TEST_CASE("frame_key is {theme}_{runner}_{index} in lower case") {
  REQUIRE(frame_key(Theme::Dark, Runner::Cat, 3) == "dark_cat_3");
  REQUIRE(frame_key(Theme::Light, Runner::Horse, 13) == "light_horse_13");
}

TEST_CASE("resolve_theme") {
  FakeAppearance dark(Theme::Dark);
  FakeAppearance light(Theme::Light);

  SECTION("explicit themes are used verbatim without probing") {
    REQUIRE(resolve_theme(Theme::Light, dark) == Theme::Light);
    REQUIRE(resolve_theme(Theme::Dark, light) == Theme::Dark);
    REQUIRE(dark.probes == 0);
    REQUIRE(light.probes == 0);
  }

  SECTION("System follows the probe") {
    REQUIRE(resolve_theme(Theme::System, dark) == Theme::Dark);
    REQUIRE(resolve_theme(Theme::System, light) == Theme::Light);
  }

  SECTION("a probe that cannot tell means Light") {
    FakeAppearance unknown(Theme::System);
    REQUIRE(resolve_theme(Theme::System, unknown) == Theme::Light);
  }
}

TEST_CASE("resolve_frame_set returns every frame in index order") {
  const auto assets = MapAssetStore::complete();
  FakeAppearance os(Theme::Light);

  const auto cat = resolve_frame_set(Runner::Cat, Theme::Light, os, assets);
  REQUIRE(keys_of(cat) == std::vector<std::string>{
    "light_cat_0", "light_cat_1", "light_cat_2", "light_cat_3", "light_cat_4"});

  const auto horse = resolve_frame_set(Runner::Horse, Theme::Dark, os, assets);
  REQUIRE(horse.size() == 14);
  REQUIRE(horse.front().key == "dark_horse_0");
  REQUIRE(horse.back().key == "dark_horse_13");
}

TEST_CASE("missing assets are skipped, not substituted") {
  MapAssetStore assets({"light_cat_0", "light_cat_1", "light_cat_3"});
  FakeAppearance os(Theme::Light);

  const auto fs = resolve_frame_set(Runner::Cat, Theme::Light, os, assets);
  REQUIRE(fs.size() == 3);
  REQUIRE(keys_of(fs) == std::vector<std::string>{"light_cat_0", "light_cat_1", "light_cat_3"});
}

TEST_CASE("no assets at all gives an empty set") {
  MapAssetStore assets;
  FakeAppearance os(Theme::Dark);
  REQUIRE(resolve_frame_set(Runner::Parrot, Theme::System, os, assets).empty());
}

TEST_CASE("System theme picks the prefix from the OS probe") {
  const auto assets = MapAssetStore::complete();
  FakeAppearance os(Theme::Dark);

  auto fs = resolve_frame_set(Runner::Parrot, Theme::System, os, assets);
  REQUIRE(fs.size() == 10);
  for (const auto& f : fs) REQUIRE(f.key.rfind("dark_", 0) == 0);

  os.set_os_theme(Theme::Light);
  os.refresh();
  fs = resolve_frame_set(Runner::Parrot, Theme::System, os, assets);
  for (const auto& f : fs) REQUIRE(f.key.rfind("light_", 0) == 0);
}

TEST_CASE("resolve_frame_set is idempotent") {
  MapAssetStore assets({"dark_horse_0", "dark_horse_5", "dark_horse_9", "light_horse_1"});
  FakeAppearance os(Theme::Dark);
  const auto a = resolve_frame_set(Runner::Horse, Theme::System, os, assets);
  const auto b = resolve_frame_set(Runner::Horse, Theme::System, os, assets);
  REQUIRE(a == b);
  REQUIRE(a.size() == 3);
}

TEST_CASE("DirectoryAssetStore finds <dir>/<key>.png") {
  TempDir dir;
  dir.write("light_cat_0.png", "png");
  dir.write("light_cat_2.png", "png");
  DirectoryAssetStore store(dir.path().string());

  auto hit = store.find("light_cat_0");
  REQUIRE(hit.has_value());
  REQUIRE(hit->key == "light_cat_0");
  REQUIRE(hit->path == dir.file("light_cat_0.png"));
  REQUIRE_FALSE(store.find("light_cat_1").has_value());

  FakeAppearance os(Theme::Light);
  REQUIRE(resolve_frame_set(Runner::Cat, Theme::Light, os, store).size() == 2);
}

TEST_CASE("DirectoryAssetStore on a missing directory finds nothing") {
  DirectoryAssetStore store("this_directory_does_not_exist");
  REQUIRE_FALSE(store.find("light_cat_0").has_value());
}
