#include "app/ProcessController.hpp"

#include <pwd.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

using harbor::collectors::ProcessSample;
using harbor::model::ProcessInfo;
using harbor::model::ProcessSort;
using harbor::model::ProcessTable;

namespace harbor::app {

static constexpr std::array<std::string_view, 8> kSystemUsers = {
  "root", "_windowserver", "_coreaudiod", "_mdnsresponder", "_spotlight", "_hidd", "_distnoted", "_networkd",
};

static constexpr std::array<std::string_view, 3> kSystemPathPrefixes = {"/System/", "/usr/", "/sbin/"};

static constexpr std::array<std::string_view, 21> kSystemNames = {
  "kernel_task", "launchd", "WindowServer", "loginwindow", "Finder", "Dock", "SystemUIServer",
  "cfprefsd", "trustd", "securityd", "distnoted", "UserEventAgent", "secinitd", "coreservicesd",
  "mds", "mds_stores", "mdworker", "notifyd", "logd", "powerd", "kthreadd",
};

ProcessController::ProcessController(harbor::collectors::IProcessSource& src, std::chrono::milliseconds sample_window)
  : src_(src), window_(sample_window) {}

std::string ProcessController::clean_name(std::string_view raw) {
  std::string name(raw);
  auto slash = name.rfind('/');
  if (slash != std::string::npos) name = name.substr(slash + 1);
  static constexpr std::array<std::string_view, 5> suffixes = {" Helper", " (Renderer)", " (GPU)", " (Plugin)", ".app"};
  bool changed = true;
  while (changed) {
    changed = false;
    for (auto suf : suffixes) {
      if (name.size() > suf.size() && name.compare(name.size() - suf.size(), suf.size(), suf) == 0) {
        name.erase(name.size() - suf.size());
        changed = true;
      }
    }
  }
  return name;
}

bool ProcessController::is_system_process(const ProcessInfo& p) {
  if (std::find(kSystemUsers.begin(), kSystemUsers.end(), p.user) != kSystemUsers.end()) return true;
  for (auto pre : kSystemPathPrefixes) {
    if (p.exe_path.rfind(pre, 0) == 0) return true;
  }
  return std::find(kSystemNames.begin(), kSystemNames.end(), p.name) != kSystemNames.end();
}

std::optional<ProcessSort> ProcessController::parse_sort(std::string_view s) {
  if (s == "cpu") return ProcessSort::Cpu;
  if (s == "memory" || s == "mem") return ProcessSort::Memory;
  if (s == "pid") return ProcessSort::Pid;
  if (s == "name") return ProcessSort::Name;
  return std::nullopt;
}

static std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

void ProcessController::sort(std::vector<ProcessInfo>& v, ProcessSort key) {
  switch (key) {
    case ProcessSort::Cpu:
      std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b){
        return a.cpu_pct != b.cpu_pct ? a.cpu_pct > b.cpu_pct : a.pid < b.pid; });
      break;
    case ProcessSort::Memory:
      std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b){
        return a.rss_bytes != b.rss_bytes ? a.rss_bytes > b.rss_bytes : a.pid < b.pid; });
      break;
    case ProcessSort::Pid:
      std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b){ return a.pid < b.pid; });
      break;
    case ProcessSort::Name:
      std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b){
        auto la = lower(a.name), lb = lower(b.name);
        return la != lb ? la < lb : a.pid < b.pid; });
      break;
  }
}

const std::string& ProcessController::user_name(uint32_t uid) {
  auto it = users_.find(uid);
  if (it != users_.end()) return it->second;
  struct passwd pw{};
  struct passwd* res = nullptr;
  char buf[4096];
  std::string name;
  if (::getpwuid_r(static_cast<uid_t>(uid), &pw, buf, sizeof(buf), &res) == 0 && res && res->pw_name)
    name = res->pw_name;
  else
    name = std::to_string(uid);
  return users_.emplace(uid, std::move(name)).first->second;
}

bool ProcessController::read(std::vector<ProcessSample>& out, std::chrono::steady_clock::time_point& at) {
  out.clear();
  at = std::chrono::steady_clock::now();
  return src_.list(out);
}

bool ProcessController::list_processes(ProcessTable& out, ProcessSort sort_key, std::string_view filter) {
  std::vector<ProcessSample> samples;
  std::chrono::steady_clock::time_point at;
  if (!have_last_) {
    if (!read(samples, at)) return false;
    last_cpu_ns_.clear();
    for (const auto& s : samples) last_cpu_ns_[s.pid] = s.cpu_time_ns;
    last_at_ = at;
    have_last_ = true;
    std::this_thread::sleep_for(window_);
  }
  if (!read(samples, at)) return false;

  double wall_ns = static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(at - last_at_).count());
  auto want = lower(filter);

  out.processes.clear();
  out.total = samples.size();
  std::unordered_map<int32_t, uint64_t> next;
  next.reserve(samples.size());
  for (const auto& s : samples) {
    next[s.pid] = s.cpu_time_ns;
    ProcessInfo p;
    p.pid = s.pid;
    p.ppid = s.ppid;
    p.uid = s.uid;
    p.exe_path = s.exe_path;
    p.rss_bytes = s.rss_bytes;
    auto app = s.exe_path.find(".app/");
    if (app != std::string::npos) p.name = clean_name(s.exe_path.substr(0, app + 4));
    else if (!s.exe_path.empty()) p.name = clean_name(s.exe_path);
    else p.name = clean_name(s.comm);
    if (p.name.empty()) p.name = s.comm;
    if (!want.empty() && lower(p.name).find(want) == std::string::npos) continue;

    auto it = last_cpu_ns_.find(s.pid);
    if (it != last_cpu_ns_.end() && wall_ns > 0 && s.cpu_time_ns >= it->second) {
      p.cpu_pct = static_cast<double>(s.cpu_time_ns - it->second) / wall_ns * 100.0;
    }
    p.user = user_name(s.uid);
    p.is_system = is_system_process(p);
    out.processes.push_back(std::move(p));
  }
  last_cpu_ns_ = std::move(next);
  last_at_ = at;
  sort(out.processes, sort_key);
  return true;
}

static std::string kill_error_message(int err) {
  switch (err) {
    case EPERM:
      return "Permission denied. The process belongs to another user or is protected by the system.";
    case ESRCH:
      return "Process not found. It may have already terminated.";
    case EINVAL:
      return "Invalid signal.";
    default:
      return std::format("Failed to send signal: {} (errno {})", std::strerror(err), err);
  }
}

TerminateResult ProcessController::terminate(int32_t pid, bool force) const {
  TerminateResult result;
  if (pid <= 1) {
    result.error_message = std::format("Refusing to signal PID {}.", pid);
    return result;
  }
  if (pid == static_cast<int32_t>(::getpid())) {
    result.error_message = "Refusing to signal harbor itself.";
    return result;
  }

  const int sig = force ? SIGKILL : SIGTERM;
  if (::kill(pid, sig) == -1) {
    int err = errno;
    result.error_message = kill_error_message(err);
    result.process_still_running = err != ESRCH;
    return result;
  }

  // Give process a moment to terminate, then check if still alive
  if (!force) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    if (::kill(pid, 0) == 0) {
      result.success = true;
      result.process_still_running = true;
      result.error_message = "SIGTERM sent. Process may still be running. Use --force (SIGKILL) if it doesn't terminate.";
      return result;
    }
  }
  result.success = true;
  return result;
}

} // namespace harbor::app
