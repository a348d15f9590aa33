#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <rcat/options.hpp>

using namespace rcat;
using Catch::Approx;

TEST_CASE("runner frame counts differ per runner") {
  REQUIRE(frame_count(Runner::Cat) == 5);
  REQUIRE(frame_count(Runner::Parrot) == 10);
  REQUIRE(frame_count(Runner::Horse) == 14);
}

TEST_CASE("tables cover every enum value in order") {
  REQUIRE(runner_table().size() == static_cast<std::size_t>(Runner::Count));
  REQUIRE(theme_table().size() == static_cast<std::size_t>(Theme::Count));
  REQUIRE(fps_max_limit_table().size() == static_cast<std::size_t>(FpsMaxLimit::Count));
  for (std::size_t i = 0; i < runner_table().size(); ++i) {
    REQUIRE(static_cast<std::size_t>(runner_table()[i].value) == i);
  }
}

TEST_CASE("persisted keys map back to their values") {
  for (const auto& r : runner_table()) REQUIRE(runner_from_key(r.key) == r.value);
  for (const auto& t : theme_table()) REQUIRE(theme_from_key(t.key) == t.value);
  for (const auto& f : fps_max_limit_table()) REQUIRE(fps_max_limit_from_key(f.key) == f.value);
}

TEST_CASE("keys are decoupled from display labels") {
  SECTION("a max-rate label is not a key") {
    REQUIRE(info(FpsMaxLimit::FPS20).label == std::string("20fps"));
    REQUIRE_FALSE(fps_max_limit_from_key("20fps").has_value());
    REQUIRE(fps_max_limit_from_key("FPS20") == FpsMaxLimit::FPS20);
  }

  SECTION("lookup is exact") {
    REQUIRE_FALSE(runner_from_key("cat").has_value());
    REQUIRE_FALSE(theme_from_key(" Dark").has_value());
    REQUIRE_FALSE(runner_from_key("").has_value());
  }
}

TEST_CASE("rate multipliers per tier") {
  REQUIRE(rate_multiplier(FpsMaxLimit::FPS40) == Approx(1.0f));
  REQUIRE(rate_multiplier(FpsMaxLimit::FPS30) == Approx(0.75f));
  REQUIRE(rate_multiplier(FpsMaxLimit::FPS20) == Approx(0.5f));
  REQUIRE(rate_multiplier(FpsMaxLimit::FPS10) == Approx(0.25f));
}

TEST_CASE("OptionState defaults") {
  OptionState o;
  REQUIRE(o.runner == Runner::Cat);
  REQUIRE(o.theme == Theme::System);
  REQUIRE(o.fps_max_limit == FpsMaxLimit::FPS40);
}
