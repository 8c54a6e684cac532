#include "collectors/DarwinProcessSource.hpp"

#include <libproc.h>
#include <sys/proc_info.h>
#include <mach/mach_time.h>

#include <vector>

namespace harbor::collectors {

DarwinProcessSource::DarwinProcessSource() {
  // pti_total_user/system are in mach absolute time units (not ns on arm64)
  mach_timebase_info_data_t tb{};
  if (mach_timebase_info(&tb) == KERN_SUCCESS && tb.denom != 0) {
    ns_per_tick_ = static_cast<double>(tb.numer) / static_cast<double>(tb.denom);
  }
}

std::vector<int> DarwinProcessSource::all_pids() {
  std::vector<int> pids;
  int n = proc_listallpids(nullptr, 0);
  if (n <= 0) return pids;
  // Leave headroom for processes spawned between the two calls
  pids.resize(static_cast<size_t>(n) + 64);
  n = proc_listallpids(pids.data(), static_cast<int>(pids.size() * sizeof(int)));
  if (n <= 0) { pids.clear(); return pids; }
  pids.resize(static_cast<size_t>(n));
  return pids;
}

bool DarwinProcessSource::list(std::vector<ProcessSample>& out) {
  out.clear();
  auto pids = all_pids();
  if (pids.empty()) return false;
  for (int pid : pids) {
    if (pid <= 0) continue;
    struct proc_taskallinfo info{};
    int got = proc_pidinfo(pid, PROC_PIDTASKALLINFO, 0, &info, sizeof(info));
    ProcessSample ps; ps.pid = pid;
    if (got == static_cast<int>(sizeof(info))) {
      ps.ppid = static_cast<int32_t>(info.pbsd.pbi_ppid);
      ps.uid = info.pbsd.pbi_uid;
      ps.comm = info.pbsd.pbi_name[0] ? info.pbsd.pbi_name : info.pbsd.pbi_comm;
      double ticks = static_cast<double>(info.ptinfo.pti_total_user + info.ptinfo.pti_total_system);
      ps.cpu_time_ns = static_cast<uint64_t>(ticks * ns_per_tick_);
      ps.rss_bytes = info.ptinfo.pti_resident_size;
    } else {
      // Task info is denied for other users' processes; BSD info is not
      struct proc_bsdshortinfo bsd{};
      if (proc_pidinfo(pid, PROC_PIDT_SHORTBSDINFO, 0, &bsd, sizeof(bsd)) != static_cast<int>(sizeof(bsd))) continue;
      ps.ppid = static_cast<int32_t>(bsd.pbsi_ppid);
      ps.uid = bsd.pbsi_uid;
      ps.comm = bsd.pbsi_comm;
    }
    char path[PROC_PIDPATHINFO_MAXSIZE];
    if (proc_pidpath(pid, path, sizeof(path)) > 0) ps.exe_path = path;
    out.push_back(std::move(ps));
  }
  return true;
}

std::vector<std::string> DarwinProcessSource::open_paths() {
  std::vector<std::string> out;
  for (int pid : all_pids()) {
    if (pid <= 0) continue;
    int bytes = proc_pidinfo(pid, PROC_PIDLISTFDS, 0, nullptr, 0);
    if (bytes <= 0) continue;
    std::vector<struct proc_fdinfo> fds(static_cast<size_t>(bytes) / sizeof(struct proc_fdinfo) + 8);
    bytes = proc_pidinfo(pid, PROC_PIDLISTFDS, 0, fds.data(), static_cast<int>(fds.size() * sizeof(struct proc_fdinfo)));
    if (bytes <= 0) continue;
    size_t count = static_cast<size_t>(bytes) / sizeof(struct proc_fdinfo);
    for (size_t i = 0; i < count; ++i) {
      if (fds[i].proc_fdtype != PROX_FDTYPE_VNODE) continue;
      struct vnode_fdinfowithpath vi{};
      int got = proc_pidfdinfo(pid, fds[i].proc_fd, PROC_PIDFDVNODEPATHINFO, &vi, sizeof(vi));
      if (got != static_cast<int>(sizeof(vi))) continue;
      if (vi.pvip.vip_path[0] == '/') out.emplace_back(vi.pvip.vip_path);
    }
  }
  return out;
}

} // namespace harbor::collectors
