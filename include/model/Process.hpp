#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace harbor::model {

struct ProcessInfo {
  int32_t pid{};
  int32_t ppid{};
  uint32_t uid{};
  std::string name;       // cleaned display name
  std::string user;
  std::string exe_path;   // may be empty when the executable is not readable
  double   cpu_pct{};     // share of one core, 0..100*ncpu
  uint64_t rss_bytes{};
  bool     is_system{false};
};

enum class ProcessSort { Cpu, Memory, Pid, Name };

struct ProcessTable {
  std::vector<ProcessInfo> processes;
  size_t total{};
};

} // namespace harbor::model
