#pragma once
#include <cstdint>
#include <vector>

namespace harbor::model {

// Cumulative scheduler ticks for one core, in the four states mach reports
// (CPU_STATE_USER/SYSTEM/NICE/IDLE). The procfs source folds iowait into idle
// and irq/softirq/steal into system.
struct CpuTicks {
  uint64_t user{}, system{}, nice{}, idle{};
  uint64_t total() const { return user + system + nice + idle; }
  uint64_t busy()  const { return user + system + nice; }
};

struct CpuCounters {
  std::vector<CpuTicks> per_core;

  CpuTicks aggregate() const {
    CpuTicks t{};
    for (const auto& c : per_core) {
      t.user += c.user; t.system += c.system; t.nice += c.nice; t.idle += c.idle;
    }
    return t;
  }
};

} // namespace harbor::model
