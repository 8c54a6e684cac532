#include "app/LeftoverResolver.hpp"
#include "app/CacheRoots.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>

namespace fs = std::filesystem;

using harbor::model::AppRecord;
using harbor::model::Category;
using harbor::model::CleanablePath;
using harbor::model::OutcomeKind;
using harbor::model::PathOutcome;
using harbor::model::Protection;
using harbor::model::ScanReport;

namespace harbor::app {

const std::vector<LeftoverLocation>& leftover_locations() {
  static const std::vector<LeftoverLocation> table = {
    {"Preferences", LeftoverScope::User, "Preferences", false, false},
    {"Application Support", LeftoverScope::User, "Application Support", true, false},
    {"Caches", LeftoverScope::User, "Caches", true, false},
    {"Saved Application State", LeftoverScope::User, "Saved Application State", false, false},
    {"Logs", LeftoverScope::User, "Logs", true, false},
    {"Containers", LeftoverScope::User, "Containers", false, false},
    {"Group Containers", LeftoverScope::User, "Group Containers", false, true},
    {"HTTP storage", LeftoverScope::User, "HTTPStorages", false, false},
    {"WebKit data", LeftoverScope::User, "WebKit", false, false},
    {"Cookies", LeftoverScope::User, "Cookies", false, false},
    {"Launch agents", LeftoverScope::User, "LaunchAgents", false, false},
    {"System launch agents", LeftoverScope::System, "LaunchAgents", false, false},
    {"System launch daemons", LeftoverScope::System, "LaunchDaemons", false, false},
  };
  return table;
}

static std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

static bool ends_with(std::string_view s, std::string_view suf) {
  return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

std::string LeftoverResolver::strip_known_suffix(std::string_view name) {
  static constexpr std::array<std::string_view, 3> suffixes = {".plist", ".savedState", ".binarycookies"};
  for (auto suf : suffixes) {
    if (name.size() > suf.size() && ends_with(name, suf)) return std::string(name.substr(0, name.size() - suf.size()));
  }
  return std::string(name);
}

bool LeftoverResolver::matches_identifier(std::string_view name, std::string_view bundle_id, bool group_style) {
  if (bundle_id.empty()) return false;
  auto n = lower(strip_known_suffix(name));
  auto id = lower(bundle_id);
  if (n == id) return true;
  if (n.size() > id.size() && n.compare(0, id.size(), id) == 0 && n[id.size()] == '.') return true;
  if (group_style) {
    if (ends_with(n, "." + id)) return true;
    if (n.find("." + id + ".") != std::string::npos) return true;
  }
  return false;
}

static void note_unreadable(std::vector<PathOutcome>* unreadable, const fs::path& p, const std::string& why) {
  std::fprintf(stderr, "harbor: LeftoverResolver: %s: %s\n", p.c_str(), why.c_str());
  if (!unreadable) return;
  PathOutcome o;
  o.path = p.string();
  o.kind = OutcomeKind::SkippedError;
  o.reason = why;
  unreadable->push_back(std::move(o));
}

bool LeftoverResolver::add(const fs::path& p, const std::string& label, bool system_scope, const LiveState& live,
                           std::vector<CleanablePath>& out, std::vector<PathOutcome>* unreadable) const {
  CleanablePath cp;
  std::string err;
  if (!policy_.inspect(p.string(), Category::AppLeftover, live, cp, err)) {
    note_unreadable(unreadable, p, err);
    return false;
  }
  cp.label = label;
  if (system_scope) {
    cp.protection = Protection::Protected;
    cp.reason = "system scope requires administrator privileges";
  }
  out.push_back(std::move(cp));
  return true;
}

std::vector<CleanablePath> LeftoverResolver::resolve(std::string_view bundle_id, std::string_view display_name,
                                                     const LiveState& live, std::vector<PathOutcome>* unreadable) const {
  std::vector<CleanablePath> out;
  if (bundle_id.empty()) return out;
  const auto& layout = policy_.layout();
  auto display = lower(display_name);

  for (const auto& loc : leftover_locations()) {
    bool system = loc.scope == LeftoverScope::System;
    fs::path dir = (system ? layout.system_library : layout.library()) / loc.rel;
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      if (ec != std::errc::no_such_file_or_directory) note_unreadable(unreadable, dir, ec.message());
      continue;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
      if (ec) { note_unreadable(unreadable, dir, "listing stopped: " + ec.message()); break; }
      auto name = it->path().filename().string();
      bool hit = matches_identifier(name, bundle_id, loc.group_style);
      if (!hit && loc.match_display_name && display.size() >= 3) hit = lower(name) == display;
      if (hit) add(it->path(), loc.label, system, live, out, unreadable);
    }
  }
  std::sort(out.begin(), out.end(), [](const CleanablePath& a, const CleanablePath& b){ return a.path < b.path; });
  return out;
}

std::vector<CleanablePath> LeftoverResolver::orphans(const InstalledIndex& installed, const LiveState& live,
                                                     std::vector<PathOutcome>* unreadable) const {
  std::vector<CleanablePath> out;
  const auto& layout = policy_.layout();

  auto owned = [&](const std::string& id) {
    if (installed.bundle_ids.count(id)) return true;
    for (const auto& inst : installed.bundle_ids) {
      if (matches_identifier(id, inst)) return true;
    }
    size_t start = 0;
    while (start <= id.size()) {
      auto dot = id.find('.', start);
      auto part = id.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
      if (!part.empty() && installed.names.count(part)) return true;
      if (dot == std::string::npos) break;
      start = dot + 1;
    }
    return false;
  };

  std::error_code ec;
  fs::directory_iterator prefs(layout.library() / "Preferences", fs::directory_options::skip_permission_denied, ec);
  if (!ec) {
    for (fs::directory_iterator end; prefs != end; prefs.increment(ec)) {
      if (ec) { note_unreadable(unreadable, layout.library() / "Preferences", "listing stopped: " + ec.message()); break; }
      auto name = prefs->path().filename().string();
      if (!ends_with(name, ".plist")) continue;
      auto id = lower(strip_known_suffix(name));
      if (id.find('.') == std::string::npos) continue;
      if (id.rfind("com.apple.", 0) == 0 || id.rfind("group.com.apple.", 0) == 0) continue;
      if (owned(id)) continue;
      if (policy_.size_of(prefs->path().string()) <= kOrphanPrefMinBytes) continue;
      add(prefs->path(), "Orphaned preferences", false, live, out, unreadable);
    }
  }

  ec.clear();
  fs::directory_iterator support(layout.library() / "Application Support", fs::directory_options::skip_permission_denied, ec);
  if (!ec) {
    for (fs::directory_iterator end; support != end; support.increment(ec)) {
      if (ec) { note_unreadable(unreadable, layout.library() / "Application Support", "listing stopped: " + ec.message()); break; }
      auto name = support->path().filename().string();
      if (name.empty() || name[0] == '.') continue;
      if (name.rfind("com.apple.", 0) == 0) continue;
      if (is_protected_app_support(name)) continue;
      auto item = lower(name);
      if (installed.names.count(item)) continue;
      bool related = false;
      for (const auto& n : installed.names) {
        if (item.find(n) != std::string::npos || n.find(item) != std::string::npos) { related = true; break; }
      }
      for (const auto& id : installed.bundle_ids) {
        if (related) break;
        if (id.find(item) != std::string::npos) related = true;
      }
      if (related) continue;
      if (policy_.size_of(support->path().string()) <= kOrphanSupportMinBytes) continue;
      add(support->path(), "Orphaned support data", false, live, out, unreadable);
    }
  }
  std::sort(out.begin(), out.end(), [](const CleanablePath& a, const CleanablePath& b){ return a.path < b.path; });
  return out;
}

ScanReport LeftoverResolver::plan_uninstall(const AppRecord& app, const LiveState& live, bool include_bundle) const {
  std::vector<CleanablePath> all;
  if (include_bundle && !app.install_path.empty()) {
    CleanablePath b;
    std::string err;
    if (policy_.inspect(app.install_path, Category::AppBundle, live, b, err)) {
      b.label = app.display_name;
      all.push_back(std::move(b));
    } else {
      std::fprintf(stderr, "harbor: LeftoverResolver: %s: %s\n", app.install_path.c_str(), err.c_str());
    }
  }
  ScanReport report;
  auto leftovers = app.leftovers.empty() ? resolve(app.bundle_id, app.display_name, live, &report.unreadable)
                                         : app.leftovers;
  all.insert(all.end(), leftovers.begin(), leftovers.end());

  std::vector<CleanablePath> candidates;
  for (auto& cp : all) {
    if (cp.protection == Protection::Deletable) candidates.push_back(std::move(cp));
    else report.excluded.push_back(std::move(cp));
  }
  std::vector<std::string> warnings;
  if (app.is_running) warnings.push_back("App is running: " + app.display_name);
  report.plan = harbor::model::make_plan(std::move(candidates), std::move(warnings));
  return report;
}

} // namespace harbor::app
