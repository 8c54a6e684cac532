#include "app/ScanPlanner.hpp"
#include "app/AppCatalog.hpp"
#include "app/LeftoverResolver.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <set>

namespace fs = std::filesystem;

using harbor::model::CleanablePath;
using harbor::model::OutcomeKind;
using harbor::model::PathOutcome;
using harbor::model::Protection;
using harbor::model::ScanReport;

namespace harbor::app {

ScanPlanner::ScanPlanner(const PathPolicy& policy, harbor::collectors::IProcessSource& procs, CleanupConfig cfg)
  : policy_(policy), procs_(procs), cfg_(std::move(cfg)) {}

bool ScanPlanner::old_enough(const fs::path& p, AgeRule age) const {
  if (age == AgeRule::None) return true;
  int days = age == AgeRule::Logs ? cfg_.log_age_days : cfg_.installer_age_days;
  struct stat st{};
  if (::lstat(p.c_str(), &st) != 0) return true;  // let inspect() report it
  auto now = std::chrono::system_clock::now();
  auto mtime = std::chrono::system_clock::from_time_t(st.st_mtime);
  return now - mtime > std::chrono::hours(24) * days;
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

void ScanPlanner::consider(const fs::path& p, const CacheRoot& root, const LiveState& live,
                           ScanReport& report, std::vector<CleanablePath>& candidates) const {
  auto name = p.filename().string();
  if (!root.extensions.empty()) {
    auto ext = lower(p.extension().string());
    if (std::find(root.extensions.begin(), root.extensions.end(), ext) == root.extensions.end()) return;
  }
  if (!old_enough(p, root.age)) return;

  CleanablePath cp;
  std::string err;
  if (!policy_.inspect(p.string(), root.category, live, cp, err, root.owner_bundle_id)) {
    PathOutcome o;
    o.path = p.string();
    o.kind = OutcomeKind::SkippedError;
    o.reason = err;
    report.unreadable.push_back(std::move(o));
    return;
  }
  cp.label = root.label;
  if (root.skip_system_names && cp.protection == Protection::Deletable &&
      (name.rfind("com.apple.", 0) == 0 || AppCatalog::is_system_app(name, ""))) {
    cp.protection = Protection::Protected;
    cp.reason = "system cache";
  }
  if (cp.protection == Protection::Deletable) candidates.push_back(std::move(cp));
  else report.excluded.push_back(std::move(cp));
}

// First component of rel below home that is a symlink, or empty. A cache root
// reached through a link may land anywhere in home, e.g. on Documents.
static fs::path symlinked_component(const fs::path& home, const std::string& rel) {
  fs::path cur = home;
  for (const auto& part : fs::path(rel)) {
    cur /= part;
    std::error_code ec;
    auto st = fs::symlink_status(cur, ec);
    if (ec || !fs::exists(st)) return {};
    if (fs::is_symlink(st)) return cur;
  }
  return {};
}

static void push_unreadable(ScanReport& report, const fs::path& p, const std::string& why) {
  PathOutcome o;
  o.path = p.string();
  o.kind = OutcomeKind::SkippedError;
  o.reason = why;
  report.unreadable.push_back(std::move(o));
}

void ScanPlanner::scan_root(const CacheRoot& root, const LiveState& live, ScanReport& report,
                            std::vector<CleanablePath>& candidates, std::stop_token st) const {
  const auto& layout = policy_.layout();
  std::vector<fs::path> bases;
  if (root.base == RootBase::Temp) {
    bases = layout.temp_roots;
  } else {
    if (auto link = symlinked_component(layout.home, root.rel); !link.empty()) {
      std::fprintf(stderr, "harbor: ScanPlanner: %s is a symbolic link, root %s skipped\n",
                   link.c_str(), root.id.c_str());
      return;
    }
    bases.push_back(layout.home / root.rel);
  }

  for (const auto& raw : bases) {
    if (st.stop_requested()) { report.cancelled = true; return; }
    std::error_code ec;
    auto base = fs::canonical(raw, ec);
    if (ec) continue;  // root absent on this host
    // A root that resolves outside home or temp (e.g. a symlinked cache dir) is skipped.
    bool temp_root = std::find(layout.temp_roots.begin(), layout.temp_roots.end(), base) != layout.temp_roots.end();
    if (!temp_root && !policy_.in_allowed_area(base.string())) {
      std::fprintf(stderr, "harbor: ScanPlanner: %s resolves outside the allowed area, skipped\n", raw.c_str());
      continue;
    }

    if (root.mode == RootMode::Self) {
      consider(base, root, live, report, candidates);
      continue;
    }

    fs::directory_iterator it(base, fs::directory_options::none, ec);
    if (ec) {
      push_unreadable(report, base, ec.message());
      continue;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
      if (ec) {
        push_unreadable(report, base, "listing stopped: " + ec.message());
        break;
      }
      if (st.stop_requested()) { report.cancelled = true; return; }
      const auto& p = it->path();
      if (root.mode == RootMode::Children) {
        consider(p, root, live, report, candidates);
        continue;
      }
      // ChildCaches
      auto name = p.filename().string();
      if (name.empty() || name[0] == '.' || is_protected_app_support(name)) continue;
      if (name.rfind("com.apple.", 0) == 0) continue;
      for (const char* leaf : {"Cache", "Caches"}) {
        auto c = p / leaf;
        std::error_code sec;
        auto sst = fs::symlink_status(c, sec);
        if (sec || !fs::is_directory(sst)) continue;
        consider(c, root, live, report, candidates);
      }
    }
  }
}

ScanReport ScanPlanner::scan(ScanKind kind, std::stop_token st) {
  ScanReport report;
  LiveState live = LiveState::capture(procs_);
  std::vector<CleanablePath> candidates;

  if (kind == ScanKind::Leftovers) {
    AppCatalog catalog(policy_);
    LeftoverResolver resolver(policy_);
    for (auto& cp : resolver.orphans(catalog.installed(), live, &report.unreadable)) {
      if (cp.protection == Protection::Deletable) candidates.push_back(std::move(cp));
      else report.excluded.push_back(std::move(cp));
    }
  } else {
    for (const auto& root : cache_roots()) {
      if (!root_in_scan(root, kind)) continue;
      scan_root(root, live, report, candidates, st);
      if (report.cancelled) break;
    }
  }

  // Rows overlap (Library/Caches/Google vs Library/Caches/Google/Chrome): keep
  // the outermost deletable entry and drop anything beneath it.
  std::sort(candidates.begin(), candidates.end(), [](const CleanablePath& a, const CleanablePath& b){ return a.path < b.path; });
  std::vector<CleanablePath> kept;
  std::set<std::string> seen;
  for (auto& cp : candidates) {
    if (!seen.insert(cp.path).second) continue;
    bool nested = false;
    for (const auto& k : kept) {
      if (PathPolicy::is_under(cp.path, k.path)) { nested = true; break; }
    }
    if (!nested) kept.push_back(std::move(cp));
  }
  std::sort(report.excluded.begin(), report.excluded.end(), [](const CleanablePath& a, const CleanablePath& b){ return a.path < b.path; });
  report.excluded.erase(std::unique(report.excluded.begin(), report.excluded.end(),
                                    [](const CleanablePath& a, const CleanablePath& b){ return a.path == b.path; }),
                        report.excluded.end());
  report.plan = harbor::model::make_plan(std::move(kept));
  return report;
}

} // namespace harbor::app
