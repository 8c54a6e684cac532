#include "collectors/ProcfsProcessSource.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <charconv>
#include <sstream>

namespace harbor::collectors {

ProcfsProcessSource::ProcfsProcessSource() {
  long t = ::sysconf(_SC_CLK_TCK);
  if (t > 0) ticks_per_sec_ = t;
  long p = ::sysconf(_SC_PAGESIZE);
  if (p > 0) page_size_ = p;
}

static bool parse_pid(const std::string& name, int32_t& pid) {
  if (name.empty() || name[0] < '0' || name[0] > '9') return false;
  auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
  return ec == std::errc{} && ptr == name.data() + name.size();
}

bool ProcfsProcessSource::parse_stat_line(const std::string& content, int32_t& ppid, uint64_t& utime,
                                          uint64_t& stime, int64_t& rss_pages, std::string& comm) {
  // comm may contain spaces and parentheses; it ends at the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) return false;
  comm = content.substr(lp + 1, rp - lp - 1);
  std::istringstream ss(content.substr(rp + 2));
  char state = '?';
  ss >> state >> ppid;
  // skip pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
  for (int i = 0; i < 9; i++) { std::string tmp; ss >> tmp; }
  ss >> utime >> stime;
  // skip cutime cstime priority nice num_threads itrealvalue starttime vsize
  for (int i = 0; i < 8; i++) { std::string tmp; ss >> tmp; }
  ss >> rss_pages;
  return !ss.fail();
}

static uint32_t uid_from_status(const std::string& txt) {
  std::istringstream ss(txt); std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("Uid:", 0) == 0) {
      std::istringstream ls(line.substr(4));
      uint32_t uid = 0; ls >> uid;
      return uid;
    }
  }
  return 0;
}

bool ProcfsProcessSource::list(std::vector<ProcessSample>& out) {
  out.clear();
  auto names = harbor::util::list_dir("/proc");
  if (names.empty()) return false;
  for (const auto& name : names) {
    int32_t pid = 0;
    if (!parse_pid(name, pid)) continue;
    const std::string base = "/proc/" + name;
    // Processes that exit between listdir and read simply drop out
    auto stat = harbor::util::read_file_string(base + "/stat");
    if (!stat) continue;
    ProcessSample ps; ps.pid = pid;
    uint64_t ut = 0, st = 0; int64_t rss = 0;
    if (!parse_stat_line(*stat, ps.ppid, ut, st, rss, ps.comm)) continue;
    ps.cpu_time_ns = (ut + st) * 1000000000ULL / static_cast<uint64_t>(ticks_per_sec_);
    ps.rss_bytes = rss > 0 ? static_cast<uint64_t>(rss) * static_cast<uint64_t>(page_size_) : 0;
    if (auto status = harbor::util::read_file_string(base + "/status")) ps.uid = uid_from_status(*status);
    if (auto exe = harbor::util::read_symlink(base + "/exe")) ps.exe_path = *exe;
    out.push_back(std::move(ps));
  }
  return true;
}

std::vector<std::string> ProcfsProcessSource::open_paths() {
  std::vector<std::string> out;
  for (const auto& name : harbor::util::list_dir("/proc")) {
    int32_t pid = 0;
    if (!parse_pid(name, pid)) continue;
    const std::string fd_dir = "/proc/" + name + "/fd";
    // Unreadable fd directories belong to other users
    for (const auto& fd : harbor::util::list_dir(fd_dir)) {
      auto target = harbor::util::read_symlink(fd_dir + "/" + fd);
      if (target && !target->empty() && target->front() == '/') out.push_back(std::move(*target));
    }
  }
  return out;
}

} // namespace harbor::collectors
