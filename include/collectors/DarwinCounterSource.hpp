#pragma once
#include "collectors/ICounterSource.hpp"

namespace harbor::collectors {

// macOS counters: host_processor_info for per-core ticks, host_statistics64
// for memory zones, getmntinfo for volumes, getifaddrs AF_LINK for
// interfaces and IOBlockStorageDriver statistics for disks.
class DarwinCounterSource : public ICounterSource {
public:
  DarwinCounterSource();
  [[nodiscard]] bool sample(harbor::model::Snapshot& out) override;
  [[nodiscard]] const char* name() const override { return "mach"; }

private:
  bool read_cpu(harbor::model::CpuCounters& out);
  bool read_memory(harbor::model::MemoryZones& out);
  static void read_volumes(std::vector<harbor::model::Volume>& out);
  static void read_interfaces(std::vector<harbor::model::NetIf>& out);
  static void read_disks(std::vector<harbor::model::DiskDev>& out);

  unsigned int host_port_{0};
  uint64_t physical_bytes_{0};
};

} // namespace harbor::collectors
