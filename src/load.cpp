#include <rcat/load.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace rcat {

std::optional<CpuTimes> parse_proc_stat(std::istream& in) {
  std::string line;
  while (std::getline(in, line)) {
    // "cpu  user nice system idle iowait irq softirq steal guest guest_nice"
    // Per-core lines ("cpu0") are skipped.
    if (line.size() < 4 || line.compare(0, 4, "cpu ") != 0) continue;

    std::istringstream ss(line.substr(4));
    std::vector<std::uint64_t> f;
    std::uint64_t v = 0;
    while (ss >> v) f.push_back(v);
    if (f.size() < 4) return std::nullopt;

    // guest/guest_nice are already counted in user/nice.
    const std::size_t n = std::min<std::size_t>(f.size(), 8);
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < n; ++i) total += f[i];
    const std::uint64_t idle = f[3] + (f.size() > 4 ? f[4] : 0);

    return CpuTimes{total - idle, total};
  }
  return std::nullopt;
}

float utilization_between(const CpuTimes& prev, const CpuTimes& cur) {
  if (cur.total <= prev.total) return 0.0f;
  const double dt = static_cast<double>(cur.total - prev.total);
  const double db = cur.busy >= prev.busy ? static_cast<double>(cur.busy - prev.busy) : 0.0;
  return static_cast<float>(100.0 * db / dt);
}

ProcStatLoadSource::ProcStatLoadSource(std::string path) : path_(std::move(path)) {
  if (!read_().has_value()) {
    throw std::runtime_error("cannot read CPU counters from " + path_);
  }
}

std::optional<CpuTimes> ProcStatLoadSource::read_() const {
  std::ifstream f(path_);
  if (!f) return std::nullopt;
  return parse_proc_stat(f);
}

float ProcStatLoadSource::sample() {
  const auto cur = read_();
  if (!cur) return last_;
  if (!have_baseline_) {
    prev_ = *cur;
    have_baseline_ = true;
    last_ = 0.0f;
    return last_;
  }
  last_ = utilization_between(prev_, *cur);
  prev_ = *cur;
  return last_;
}

LoadSampler::LoadSampler(LoadSource& source) : source_(source) {
  (void)source_.sample(); // warm-up read, never surfaced
}

float LoadSampler::sample() {
  return std::min(100.0f, source_.sample());
}

} // namespace rcat
