#pragma once
#include "collectors/ICounterSource.hpp"

namespace harbor::collectors {

// Linux counters from /proc (honors HARBOR_PROC_ROOT). CPU and memory are
// required; volumes, interfaces and disks are best effort.
class ProcfsCounterSource : public ICounterSource {
public:
  ProcfsCounterSource() = default;
  [[nodiscard]] bool sample(harbor::model::Snapshot& out) override;
  [[nodiscard]] const char* name() const override { return "procfs"; }

  static constexpr uint64_t kSectorSize = 512;

private:
  static bool read_cpu(harbor::model::CpuCounters& out);
  static bool read_memory(harbor::model::MemoryZones& out);
  static void read_volumes(std::vector<harbor::model::Volume>& out);
  static void read_interfaces(std::vector<harbor::model::NetIf>& out);
  static void read_disks(std::vector<harbor::model::DiskDev>& out);
};

} // namespace harbor::collectors
