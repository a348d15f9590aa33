#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace rcat {

// Raw CPU utilization counter, percent. Like most OS counters the first
// reading after construction is meaningless.
class LoadSource {
public:
  virtual ~LoadSource() = default;
  virtual float sample() = 0;
};

// Aggregate jiffies from the "cpu" line of /proc/stat.
struct CpuTimes {
  std::uint64_t busy = 0;
  std::uint64_t total = 0;
};

// Stream parser (test-friendly). nullopt if no aggregate cpu line is found.
std::optional<CpuTimes> parse_proc_stat(std::istream& in);

// Busy share between two readings, percent. 0 when no time elapsed.
float utilization_between(const CpuTimes& prev, const CpuTimes& cur);

// LoadSource backed by /proc/stat deltas.
class ProcStatLoadSource : public LoadSource {
public:
  // Throws std::runtime_error if the file cannot be read or parsed.
  explicit ProcStatLoadSource(std::string path = "/proc/stat");

  // Percent busy since the previous call; the first call has no baseline and
  // reports 0. A failed read keeps the old baseline and repeats the last value.
  float sample() override;

private:
  std::optional<CpuTimes> read_() const;

  std::string path_;
  CpuTimes prev_{};
  bool have_baseline_{false};
  float last_{0.0f};
};

// Counter wrapper that hides the warm-up read and caps jitter above 100.
class LoadSampler {
public:
  // Takes and discards the warm-up read.
  explicit LoadSampler(LoadSource& source);

  float sample();

private:
  LoadSource& source_;
};

} // namespace rcat
