#pragma once
#include <string>

namespace rcat {

// Process-wide single-instance guard: exclusive non-blocking flock() on a
// lock file, held until destruction.
class InstanceLock {
public:
  explicit InstanceLock(std::string path);
  ~InstanceLock();
  InstanceLock(const InstanceLock&) = delete;
  InstanceLock& operator=(const InstanceLock&) = delete;

  // False when another holder exists (or the file cannot be opened).
  bool acquired() const { return fd_ >= 0; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  int fd_{-1};
};

// $XDG_RUNTIME_DIR/rcat.lock, else /tmp/rcat-<uid>.lock
std::string default_lock_path();

} // namespace rcat
