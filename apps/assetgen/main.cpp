// Renders the runner animation frames as PNGs:
//   rcat_assetgen <out_dir>
// One file per (theme, runner, frame) named by rcat::frame_key().
#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <string>

#include <rcat/frames.hpp>
#include <rcat/options.hpp>

using namespace rcat;

namespace {

static constexpr int kSize = 32;
static constexpr double kPI = 3.14159265358979323846;

struct Pen {
  Image* img;
  Color c;
};

// Round-capped stroke built from filled circles.
static void stroke(const Pen& p, double x0, double y0, double x1, double y1, int r) {
  const double len = std::hypot(x1 - x0, y1 - y0);
  const int steps = std::max(1, static_cast<int>(len * 2.0));
  for (int i = 0; i <= steps; ++i) {
    const double t = double(i) / steps;
    ImageDrawCircle(p.img, int(std::lround(x0 + (x1 - x0) * t)),
                    int(std::lround(y0 + (y1 - y0) * t)), r, p.c);
  }
}

// Leg hinged at (hx, hy), swinging by `swing` radians from vertical.
static void leg(const Pen& p, double hx, double hy, double len, double swing) {
  stroke(p, hx, hy, hx + std::sin(swing) * len, hy + std::cos(swing) * len, 1);
}

static void draw_cat(const Pen& p, double phase) {
  const double bob = std::sin(phase * 2.0) * 0.8;
  stroke(p, 9, 17 + bob, 21, 17 + bob, 4);                  // body
  ImageDrawCircle(p.img, 24, int(13 + bob), 4, p.c);        // head
  stroke(p, 22, 10 + bob, 22, 7 + bob, 1);                  // ears
  stroke(p, 26, 10 + bob, 26, 7 + bob, 1);
  stroke(p, 6, 15 + bob, 3, 10 + bob + std::sin(phase) * 2.0, 1); // tail
  const double s = std::sin(phase) * 0.7;
  leg(p, 11, 20 + bob, 8, s);
  leg(p, 13, 20 + bob, 8, -s);
  leg(p, 19, 20 + bob, 8, -s);
  leg(p, 21, 20 + bob, 8, s);
}

static void draw_parrot(const Pen& p, double phase) {
  const double lift = std::sin(phase) * 2.0;
  ImageDrawCircle(p.img, 15, int(17 - lift), 6, p.c);       // body
  ImageDrawCircle(p.img, 21, int(10 - lift), 4, p.c);       // head
  stroke(p, 25, 10 - lift, 28, 12 - lift, 1);               // beak
  stroke(p, 10, 21 - lift, 5, 27 - lift, 1);                // tail
  const double wing = std::sin(phase) * 1.1;
  stroke(p, 14, 15 - lift, 14 - std::cos(wing) * 9, 15 - lift - std::sin(wing) * 9, 2);
  leg(p, 15, 23 - lift, 4, 0.2);
}

static void draw_horse(const Pen& p, double phase) {
  const double bob = std::sin(phase * 2.0) * 0.8;
  stroke(p, 8, 15 + bob, 21, 15 + bob, 4);                  // body
  stroke(p, 21, 13 + bob, 25, 6 + bob, 2);                  // neck
  stroke(p, 25, 6 + bob, 29, 9 + bob, 2);                   // head
  stroke(p, 6, 13 + bob, 3, 19 + bob + std::sin(phase) * 2.0, 1); // tail
  const double s = std::sin(phase) * 0.8;
  const double c = std::cos(phase) * 0.8;
  leg(p, 9, 18 + bob, 11, s);
  leg(p, 11, 18 + bob, 11, c);
  leg(p, 19, 18 + bob, 11, -s);
  leg(p, 21, 18 + bob, 11, -c);
}

static Image render(Runner r, Theme t, int index) {
  Image img = GenImageColor(kSize, kSize, BLANK);
  const Color ink = (t == Theme::Dark) ? Color{235, 235, 235, 255} : Color{30, 30, 30, 255};
  const Pen pen{&img, ink};
  const double phase = 2.0 * kPI * double(index) / double(frame_count(r));
  switch (r) {
    case Runner::Cat:    draw_cat(pen, phase); break;
    case Runner::Parrot: draw_parrot(pen, phase); break;
    case Runner::Horse:  draw_horse(pen, phase); break;
    default: break;
  }
  return img;
}

} // namespace

int main(int argc, char** argv) {
  const std::string out_dir = argc > 1 ? argv[1] : "assets";
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    TraceLog(LOG_ERROR, "RCAT: cannot create %s: %s", out_dir.c_str(), ec.message().c_str());
    return 1;
  }

  int written = 0;
  for (const auto& r : runner_table()) {
    for (Theme t : {Theme::Light, Theme::Dark}) {
      for (int i = 0; i < r.frames; ++i) {
        const std::string path = out_dir + "/" + frame_key(t, r.value, i) + ".png";
        Image img = render(r.value, t, i);
        const bool ok = ExportImage(img, path.c_str());
        UnloadImage(img);
        if (!ok) {
          TraceLog(LOG_ERROR, "RCAT: failed to write %s", path.c_str());
          return 1;
        }
        ++written;
      }
    }
  }
  TraceLog(LOG_INFO, "RCAT: wrote %d frames to %s", written, out_dir.c_str());
  return 0;
}
