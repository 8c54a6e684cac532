#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace harbor::collectors {

// Raw per-process counters. CPU time is cumulative; the ProcessController
// turns two reads into a percentage.
struct ProcessSample {
  int32_t pid{};
  int32_t ppid{};
  uint32_t uid{};
  std::string comm;
  std::string exe_path;
  uint64_t cpu_time_ns{};
  uint64_t rss_bytes{};
};

class IProcessSource {
public:
  virtual ~IProcessSource() = default;

  // Enumerate live processes. False if the process table could not be read.
  [[nodiscard]] virtual bool list(std::vector<ProcessSample>& out) = 0;

  // Absolute paths of files currently held open by processes this user can
  // inspect. Processes we may not inspect are silently absent.
  [[nodiscard]] virtual std::vector<std::string> open_paths() = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace harbor::collectors
