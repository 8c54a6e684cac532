#pragma once
#include "collectors/IProcessSource.hpp"

namespace harbor::collectors {

// /proc scanner (honors HARBOR_PROC_ROOT)
class ProcfsProcessSource : public IProcessSource {
public:
  ProcfsProcessSource();
  [[nodiscard]] bool list(std::vector<ProcessSample>& out) override;
  [[nodiscard]] std::vector<std::string> open_paths() override;
  [[nodiscard]] const char* name() const override { return "procfs"; }

  static bool parse_stat_line(const std::string& content, int32_t& ppid, uint64_t& utime,
                              uint64_t& stime, int64_t& rss_pages, std::string& comm);

private:
  long ticks_per_sec_{100};
  long page_size_{4096};
};

} // namespace harbor::collectors
