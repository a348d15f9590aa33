#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <rcat/indicator.hpp>
#include <rcat/menu.hpp>
#include "fakes.hpp"

using namespace rcat;
using namespace rcat::test;

static const MenuItem& find_item(const std::vector<MenuItem>& items, const std::string& label) {
  auto it = std::find_if(items.begin(), items.end(),
                         [&](const MenuItem& m){ return m.label == label; });
  REQUIRE(it != items.end());
  return *it;
}

TEST_CASE("build_menu lays out every section in order") {
  const auto items = build_menu(OptionState{}, false, "v1.0.0");
  REQUIRE(items.size() == 16);

  REQUIRE(items[0].header);
  REQUIRE(items[0].label == "Runner");
  REQUIRE(items[1].label == "Cat");
  REQUIRE(items[3].label == "Horse");
  REQUIRE(items[4].header);
  REQUIRE(items[4].label == "Theme");
  REQUIRE(items[8].label == "FPS Max Limit");
  REQUIRE(items[9].label == "40fps");
  REQUIRE(items[12].label == "10fps");
  REQUIRE(items[13].action == MenuAction::ToggleStartup);
  REQUIRE(items[14].label == "v1.0.0");
  REQUIRE_FALSE(items[14].enabled);
  REQUIRE(items[15].action == MenuAction::Exit);
}

TEST_CASE("build_menu checks the current choices") {
  OptionState o;
  o.runner = Runner::Parrot;
  o.theme = Theme::Dark;
  o.fps_max_limit = FpsMaxLimit::FPS20;
  const auto items = build_menu(o, true, "v");

  REQUIRE(find_item(items, "Parrot").checked);
  REQUIRE_FALSE(find_item(items, "Cat").checked);
  REQUIRE(find_item(items, "Dark").checked);
  REQUIRE_FALSE(find_item(items, "System").checked);
  REQUIRE(find_item(items, "20fps").checked);
  REQUIRE_FALSE(find_item(items, "40fps").checked);
  REQUIRE(find_item(items, "Startup").checked);

  const auto checked = std::count_if(items.begin(), items.end(),
                                     [](const MenuItem& m){ return m.checked; });
  REQUIRE(checked == 4);
}

TEST_CASE("apply_menu_item routes choices to the indicator") {
  FakeLoadSource load({0.0f});
  FakeAppearance appearance(Theme::Light);
  const auto assets = MapAssetStore::complete();
  RecordingSurface surface;
  MemorySettingsStore settings;
  Indicator ind(load, appearance, assets, surface, settings);
  FakeAutostart autostart;

  const auto items = build_menu(ind.options(), autostart.is_enabled(), "v");

  REQUIRE(apply_menu_item(find_item(items, "Horse"), ind, autostart, "/x") == MenuOutcome::Handled);
  REQUIRE(ind.options().runner == Runner::Horse);
  REQUIRE(ind.animator().frames().size() == 14);

  REQUIRE(apply_menu_item(find_item(items, "Dark"), ind, autostart, "/x") == MenuOutcome::Handled);
  REQUIRE(ind.options().theme == Theme::Dark);

  REQUIRE(apply_menu_item(find_item(items, "10fps"), ind, autostart, "/x") == MenuOutcome::Handled);
  REQUIRE(ind.options().fps_max_limit == FpsMaxLimit::FPS10);

  SECTION("headers and the version line do nothing") {
    const OptionState before = ind.options();
    REQUIRE(apply_menu_item(items[0], ind, autostart, "/x") == MenuOutcome::Handled);
    REQUIRE(apply_menu_item(items[14], ind, autostart, "/x") == MenuOutcome::Handled);
    REQUIRE(ind.options() == before);
  }

  SECTION("out-of-range values are ignored") {
    MenuItem bogus;
    bogus.action = MenuAction::SelectRunner;
    bogus.value = 42;
    REQUIRE(apply_menu_item(bogus, ind, autostart, "/x") == MenuOutcome::Handled);
    REQUIRE(ind.options().runner == Runner::Horse);

    MenuItem unknown;
    unknown.action = static_cast<MenuAction>(99);
    REQUIRE(apply_menu_item(unknown, ind, autostart, "/x") == MenuOutcome::Handled);
    REQUIRE(ind.options().runner == Runner::Horse);
  }

  SECTION("Exit") {
    REQUIRE(apply_menu_item(items[15], ind, autostart, "/x") == MenuOutcome::Exit);
  }
}

TEST_CASE("startup toggle follows the store, not the item") {
  FakeLoadSource load({0.0f});
  FakeAppearance appearance(Theme::Light);
  MapAssetStore assets;
  RecordingSurface surface;
  MemorySettingsStore settings;
  Indicator ind(load, appearance, assets, surface, settings);
  FakeAutostart autostart;

  // Stale menu built while the entry was present.
  const auto stale = build_menu(ind.options(), true, "v");
  const MenuItem& startup = find_item(stale, "Startup");

  REQUIRE(apply_menu_item(startup, ind, autostart, "/usr/bin/rcat_tray") == MenuOutcome::Handled);
  REQUIRE(autostart.present);
  REQUIRE(autostart.last_enable_path == "/usr/bin/rcat_tray");

  REQUIRE(apply_menu_item(startup, ind, autostart, "/usr/bin/rcat_tray") == MenuOutcome::Handled);
  REQUIRE_FALSE(autostart.present);

  SECTION("a store failure is reported") {
    autostart.fail = true;
    REQUIRE(apply_menu_item(startup, ind, autostart, "/usr/bin/rcat_tray") == MenuOutcome::Failed);
    REQUIRE_FALSE(autostart.present);
  }
}
