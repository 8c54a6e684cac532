#pragma once
#include <cstdint>
#include <string>

namespace harbor::model {

// Cumulative byte counters for one interface since boot (or driver reset).
struct NetIf {
  std::string name;
  uint64_t rx_bytes{};
  uint64_t tx_bytes{};
};

} // namespace harbor::model
