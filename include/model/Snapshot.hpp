#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "model/Cpu.hpp"
#include "model/Net.hpp"
#include "model/Disk.hpp"
#include "model/Fs.hpp"

namespace harbor::model {

// Memory zones in bytes. "used" follows Activity Monitor: active + wired +
// compressed. Percentages are derived from the latest snapshot only.
struct MemoryZones {
  uint64_t total_bytes{};
  uint64_t active_bytes{};
  uint64_t wired_bytes{};
  uint64_t compressed_bytes{};
  uint64_t inactive_bytes{};
  uint64_t free_bytes{};

  uint64_t used_bytes() const { return active_bytes + wired_bytes + compressed_bytes; }
  double used_pct() const {
    if (total_bytes == 0) return 0.0;
    double pct = 100.0 * static_cast<double>(used_bytes()) / static_cast<double>(total_bytes);
    return pct > 100.0 ? 100.0 : pct;
  }
};

// One consistent read of all raw counters. Produced fresh each tick and never
// mutated after the counter source returns it.
struct Snapshot {
  std::chrono::steady_clock::time_point taken{};
  uint64_t wall_ms{}; // system_clock, for display and journal lines
  CpuCounters cpu;
  MemoryZones mem;
  std::vector<Volume> volumes;
  std::vector<NetIf> interfaces;
  std::vector<DiskDev> disks;
};

} // namespace harbor::model
