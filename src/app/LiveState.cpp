#include "app/LiveState.hpp"
#include "util/Plist.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace harbor::app {

static bool any_at_or_under(const std::vector<std::string>& sorted, const std::string& p) {
  if (p.empty()) return false;
  // Entries that start with p sort contiguously from lower_bound(p); "p-x" and
  // "p.x" interleave with "p/x", so scan the whole run.
  for (auto it = std::lower_bound(sorted.begin(), sorted.end(), p); it != sorted.end(); ++it) {
    if (it->compare(0, p.size(), p) != 0) break;
    if (it->size() == p.size() || (*it)[p.size()] == '/') return true;
  }
  return false;
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

bool LiveState::open_at_or_under(const std::string& p) const { return any_at_or_under(open_paths, p); }

bool LiveState::exe_under(const std::string& p) const { return any_at_or_under(running_exes, p); }

bool LiveState::bundle_running(const std::string& name) const {
  auto n = lower(name);
  for (const auto& id : running_bundle_ids) {
    if (n == id) return true;
    if (n.size() > id.size() && n.compare(0, id.size(), id) == 0 && n[id.size()] == '.') return true;
  }
  return false;
}

bool LiveState::app_name_running(const std::string& name) const {
  if (name.empty()) return false;
  const std::string needle = "/" + name + ".app/";
  for (const auto& exe : running_exes) {
    if (exe.find(needle) != std::string::npos) return true;
  }
  return false;
}

void LiveState::normalize() {
  std::sort(open_paths.begin(), open_paths.end());
  open_paths.erase(std::unique(open_paths.begin(), open_paths.end()), open_paths.end());
  std::sort(running_exes.begin(), running_exes.end());
  running_exes.erase(std::unique(running_exes.begin(), running_exes.end()), running_exes.end());
}

LiveState LiveState::capture(harbor::collectors::IProcessSource& src) {
  LiveState s;
  s.open_paths = src.open_paths();
  std::vector<harbor::collectors::ProcessSample> procs;
  if (src.list(procs)) {
    std::unordered_map<std::string, std::string> bundle_ids;
    for (const auto& p : procs) {
      if (p.exe_path.empty()) continue;
      s.running_exes.push_back(p.exe_path);
      auto pos = p.exe_path.find(".app/Contents/");
      if (pos == std::string::npos) continue;
      std::string bundle = p.exe_path.substr(0, pos + 4);
      auto it = bundle_ids.find(bundle);
      if (it == bundle_ids.end()) {
        std::string id;
        if (auto info = harbor::util::read_plist_strings(bundle + "/Contents/Info.plist")) {
          if (auto f = info->find("CFBundleIdentifier"); f != info->end()) id = lower(f->second);
        }
        it = bundle_ids.emplace(bundle, id).first;
      }
      if (!it->second.empty()) s.running_bundle_ids.insert(it->second);
    }
  }
  s.normalize();
  return s;
}

} // namespace harbor::app
