#include <catch2/catch_test_macros.hpp>
#include <rcat/animator.hpp>
#include "fakes.hpp"

using namespace rcat;
using namespace rcat::test;

static FrameSet make_frames(std::size_t n, const std::string& prefix = "f") {
  FrameSet fs;
  for (std::size_t i = 0; i < n; ++i) fs.push_back(Frame{prefix + std::to_string(i), ""});
  return fs;
}

TEST_CASE("on_tick with an empty frame set is a no-op") {
  RecordingSurface surface;
  Animator a(surface);
  a.on_tick();
  REQUIRE(surface.shown.empty());
  REQUIRE(a.cursor() == 0);
}

TEST_CASE("on_tick cycles through the frames") {
  RecordingSurface surface;
  Animator a(surface);
  a.set_frames(make_frames(3));
  for (int i = 0; i < 4; ++i) a.on_tick();

  REQUIRE(surface.shown.size() == 4);
  REQUIRE(surface.shown[0].key == "f0");
  REQUIRE(surface.shown[1].key == "f1");
  REQUIRE(surface.shown[2].key == "f2");
  REQUIRE(surface.shown[3].key == "f0");
  REQUIRE(a.cursor() == 1);
}

TEST_CASE("a stale cursor after a shorter rebuild restarts at frame 0") {
  RecordingSurface surface;
  Animator a(surface);
  a.set_frames(make_frames(14, "long"));
  for (int i = 0; i < 12; ++i) a.on_tick();
  REQUIRE(a.cursor() == 12);

  a.set_frames(make_frames(5, "short"));
  REQUIRE(a.cursor() == 12); // clamped lazily
  a.on_tick();
  REQUIRE(surface.shown.back().key == "short0");
  REQUIRE(a.cursor() == 1);
}

TEST_CASE("cursor stays in range for any prior cursor and new length") {
  for (std::size_t prior = 0; prior < 12; ++prior) {
    for (std::size_t len = 1; len <= 6; ++len) {
      RecordingSurface surface;
      Animator a(surface);
      a.set_frames(make_frames(12));
      for (std::size_t i = 0; i < prior; ++i) a.on_tick();
      a.set_frames(make_frames(len));
      a.on_tick();
      REQUIRE(a.cursor() < len);
    }
  }
}

TEST_CASE("a rebuild of the same length keeps the cycle position") {
  RecordingSurface surface;
  Animator a(surface);
  a.set_frames(make_frames(5, "light"));
  a.on_tick();
  a.on_tick();
  a.set_frames(make_frames(5, "dark"));
  a.on_tick();
  REQUIRE(surface.shown.back().key == "dark2");
}

TEST_CASE("poll ticks only while running") {
  RecordingSurface surface;
  Animator a(surface, 200);
  a.set_frames(make_frames(4));

  a.poll(1000);
  REQUIRE(surface.shown.empty());

  a.start(0);
  a.poll(199);
  REQUIRE(surface.shown.empty());
  a.poll(200);
  REQUIRE(surface.shown.size() == 1);

  a.stop();
  a.poll(2000);
  REQUIRE(surface.shown.size() == 1);
}

TEST_CASE("retune changes pacing but not the cursor") {
  RecordingSurface surface;
  Animator a(surface, 200);
  a.set_frames(make_frames(4));
  a.start(0);
  a.poll(200);
  a.poll(400);
  REQUIRE(a.cursor() == 2);

  a.retune(50, 410);
  REQUIRE(a.interval_ms() == 50);
  REQUIRE(a.cursor() == 2);

  a.poll(459);
  REQUIRE(surface.shown.size() == 2);
  a.poll(460);
  REQUIRE(surface.shown.size() == 3);
  REQUIRE(surface.shown.back().key == "f2");

  // Old 200 ms schedule is gone: nothing extra fires at 600.
  a.poll(600);
  REQUIRE(surface.shown.size() == 5); // 510, 560
}

TEST_CASE("start is idempotent") {
  RecordingSurface surface;
  Animator a(surface, 100);
  a.set_frames(make_frames(2));
  a.start(0);
  a.start(90);
  a.poll(100);
  REQUIRE(surface.shown.size() == 1);
}
