#pragma once
#include "collectors/IProcessSource.hpp"

namespace harbor::collectors {

// libproc-based process table (proc_listallpids, PROC_PIDTASKALLINFO) and
// open vnode paths (PROC_PIDLISTFDS + PROC_PIDFDVNODEPATHINFO).
class DarwinProcessSource : public IProcessSource {
public:
  DarwinProcessSource();
  [[nodiscard]] bool list(std::vector<ProcessSample>& out) override;
  [[nodiscard]] std::vector<std::string> open_paths() override;
  [[nodiscard]] const char* name() const override { return "libproc"; }

private:
  static std::vector<int> all_pids();
  double ns_per_tick_{1.0};
};

} // namespace harbor::collectors
