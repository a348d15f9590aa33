#pragma once
#include <rcat/options.hpp>

namespace rcat {

// Slowest animation: one frame every 500 ms (2 fps) at zero load.
inline constexpr double kSlowestIntervalMs = 500.0;

// Frames per second the animation runs at for a load reading in percent.
// Floors at 1.0; scales linearly with load and the tier multiplier.
double animation_rate(float load, FpsMaxLimit limit);

// Milliseconds between frame advances: round(500 / rate).
// Range: 500 ms at idle down to 25 ms at 100% on FPS40.
int interval_ms(float load, FpsMaxLimit limit);

} // namespace rcat
