#pragma once
#include <cstdint>
#include <string>

namespace harbor::model {

struct Volume {
  std::string device;
  std::string mountpoint;
  std::string fstype;
  uint64_t total_bytes{};
  uint64_t free_bytes{};  // available to unprivileged users
  uint64_t used_bytes{};  // total - free
  double used_pct() const {
    return total_bytes > 0 ? 100.0 * static_cast<double>(used_bytes) / static_cast<double>(total_bytes) : 0.0;
  }
};

} // namespace harbor::model
