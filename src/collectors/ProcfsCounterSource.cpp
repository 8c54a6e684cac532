#include "collectors/ProcfsCounterSource.hpp"
#include "util/Procfs.hpp"

#include <sys/statvfs.h>

#include <charconv>
#include <chrono>
#include <sstream>
#include <string_view>
#include <unordered_set>

namespace harbor::collectors {

static inline uint64_t parse_u64(std::string_view s) {
  uint64_t v = 0;
  // strip non-digits on right (e.g., kB)
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

static harbor::model::CpuTicks parse_cpu_line(std::string_view line) {
  uint64_t vals[8]{};
  auto pos = line.find(' ');
  if (pos != std::string_view::npos) {
    std::string_view rest = line.substr(pos + 1);
    int i = 0; size_t start = 0;
    while (i < 8 && start < rest.size()) {
      while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
      size_t end = start;
      while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
      if (end > start) std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
      start = end + 1;
    }
  }
  // user nice system idle iowait irq softirq steal
  harbor::model::CpuTicks t{};
  t.user = vals[0];
  t.nice = vals[1];
  t.system = vals[2] + vals[5] + vals[6] + vals[7];
  t.idle = vals[3] + vals[4];
  return t;
}

bool ProcfsCounterSource::read_cpu(harbor::model::CpuCounters& out) {
  auto txt_opt = harbor::util::read_file_string("/proc/stat");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  out.per_core.clear();
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    // per-core lines only: "cpuN ..."
    if (line.size() > 3 && line.starts_with("cpu") && line[3] >= '0' && line[3] <= '9') {
      out.per_core.push_back(parse_cpu_line(line));
    }
    start = end + 1;
  }
  return !out.per_core.empty();
}

bool ProcfsCounterSource::read_memory(harbor::model::MemoryZones& out) {
  auto txt_opt = harbor::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;
  uint64_t total = 0, free = 0, avail = 0, inactive = 0, sunreclaim = 0, kstack = 0, pagetables = 0, zswap = 0;
  bool have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) total = parse_u64(line.substr(9));
    else if (line.starts_with("MemFree:")) free = parse_u64(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { avail = parse_u64(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Inactive:")) inactive = parse_u64(line.substr(9));
    else if (line.starts_with("SUnreclaim:")) sunreclaim = parse_u64(line.substr(11));
    else if (line.starts_with("KernelStack:")) kstack = parse_u64(line.substr(12));
    else if (line.starts_with("PageTables:")) pagetables = parse_u64(line.substr(11));
    else if (line.starts_with("Zswap:")) zswap = parse_u64(line.substr(6));
    start = end + 1;
  }
  if (total == 0) return false;
  if (!have_avail) avail = free;
  // Map onto mach zones: kernel-owned pages are "wired", zswap is "compressed",
  // the rest of (total - available) is "active".
  uint64_t used = total > avail ? total - avail : 0;
  uint64_t wired = sunreclaim + kstack + pagetables;
  if (wired > used) wired = used;
  uint64_t compressed = zswap;
  if (compressed > used - wired) compressed = used - wired;
  out.total_bytes = total * 1024;
  out.wired_bytes = wired * 1024;
  out.compressed_bytes = compressed * 1024;
  out.active_bytes = (used - wired - compressed) * 1024;
  out.inactive_bytes = inactive * 1024;
  out.free_bytes = free * 1024;
  return true;
}

static bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","overlay","squashfs"
  };
  return bad.count(fstype) != 0;
}

void ProcfsCounterSource::read_volumes(std::vector<harbor::model::Volume>& out) {
  out.clear();
  auto txt = harbor::util::read_file_string("/proc/self/mounts");
  if (!txt) return;
  std::istringstream ss(*txt);
  std::string line;
  std::unordered_set<std::string> seen;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (is_pseudo_fs(fstype) || !seen.insert(mountpoint).second) continue;
    struct statvfs vfs{};
    if (::statvfs(mountpoint.c_str(), &vfs) != 0) continue;
    harbor::model::Volume v;
    v.device = device;
    v.mountpoint = mountpoint;
    v.fstype = fstype;
    v.total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    v.free_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    v.used_bytes = v.total_bytes > v.free_bytes ? v.total_bytes - v.free_bytes : 0;
    out.push_back(std::move(v));
  }
}

void ProcfsCounterSource::read_interfaces(std::vector<harbor::model::NetIf>& out) {
  out.clear();
  auto txt = harbor::util::read_file_string("/proc/net/dev");
  if (!txt) return;
  std::istringstream ss(*txt);
  std::string line; int line_no = 0;
  while (std::getline(ss, line)) {
    if (++line_no <= 2) continue; // headers
    auto colon = line.find(':'); if (colon == std::string::npos) continue;
    std::string name = line.substr(0, colon);
    while (!name.empty() && name.front() == ' ') name.erase(name.begin());
    if (name.rfind("lo",0)==0 || name.rfind("veth",0)==0 || name.rfind("docker",0)==0 || name.rfind("br-",0)==0 || name.rfind("virbr",0)==0)
      continue;
    std::istringstream ns(line.substr(colon + 1));
    harbor::model::NetIf nif; nif.name = name;
    ns >> nif.rx_bytes;
    for (int i = 0; i < 7; i++) { uint64_t tmp; ns >> tmp; }
    ns >> nif.tx_bytes;
    out.push_back(std::move(nif));
  }
}

void ProcfsCounterSource::read_disks(std::vector<harbor::model::DiskDev>& out) {
  out.clear();
  auto txt = harbor::util::read_file_string("/proc/diskstats");
  if (!txt) return;
  std::istringstream ss(*txt); std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    unsigned major = 0, minor = 0; std::string name;
    uint64_t rd = 0, rdmerge = 0, rdsec = 0, rdtm = 0, wr = 0, wrmerge = 0, wrsec = 0;
    if (!(ls >> major >> minor >> name >> rd >> rdmerge >> rdsec >> rdtm >> wr >> wrmerge >> wrsec)) continue;
    if (name.rfind("loop",0)==0 || name.rfind("ram",0)==0) continue; // virtual
    out.push_back(harbor::model::DiskDev{name, rdsec * kSectorSize, wrsec * kSectorSize});
  }
}

bool ProcfsCounterSource::sample(harbor::model::Snapshot& out) {
  out.taken = std::chrono::steady_clock::now();
  out.wall_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
  if (!read_cpu(out.cpu)) return false;
  if (!read_memory(out.mem)) return false;
  read_volumes(out.volumes);
  read_interfaces(out.interfaces);
  read_disks(out.disks);
  return true;
}

} // namespace harbor::collectors
