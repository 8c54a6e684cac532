#pragma once
#include <cstdint>
#include <string>

namespace harbor::model {

// Cumulative transfer counters for one block device.
struct DiskDev {
  std::string name;
  uint64_t read_bytes{};
  uint64_t write_bytes{};
};

} // namespace harbor::model
