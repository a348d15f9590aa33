#include <rcat/speed.hpp>
#include <algorithm>
#include <cmath>

namespace rcat {

double animation_rate(float load, FpsMaxLimit limit) {
  const double scaled = (static_cast<double>(load) / 5.0) * rate_multiplier(limit);
  return std::max(1.0, scaled);
}

int interval_ms(float load, FpsMaxLimit limit) {
  return static_cast<int>(std::lround(kSlowestIntervalMs / animation_rate(load, limit)));
}

} // namespace rcat
