#include "app/AppCatalog.hpp"
#include "app/CleanupExecutor.hpp"
#include "app/CleanupJournal.hpp"
#include "app/CleanupService.hpp"
#include "app/Config.hpp"
#include "app/HostLayout.hpp"
#include "app/LeftoverResolver.hpp"
#include "app/PathPolicy.hpp"
#include "app/ProcessController.hpp"
#include "app/Sampler.hpp"
#include "app/ScanPlanner.hpp"
#include "app/StartupItems.hpp"
#include "app/TelemetryBuffers.hpp"
#include "app/TrashBin.hpp"
#include "collectors/PlatformFactory.hpp"
#include "util/Format.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using harbor::util::format_bytes;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

static void usage() {
  std::cout << "Usage: harbor <command> [options]\n"
               "  watch [--iterations N]              live telemetry until Ctrl+C\n"
               "  scan <kind>                         list what a cleanup would move to the trash\n"
               "  clean <kind> --yes                  move the scanned entries to the trash\n"
               "  apps                                installed removable applications\n"
               "  leftovers <bundle-id>               files an application left outside its bundle\n"
               "  uninstall <bundle-id> --yes [--ack-running] [--keep-app]\n"
               "  ps [--sort cpu|memory|pid|name] [--filter text] [--limit N]\n"
               "  kill <pid> [--force]\n"
               "  startup [enable|disable|remove <label>] [--yes]\n"
               "Kinds: caches browser app-caches developer logs tmp installers leftovers\n";
}

static bool parse_int(const std::string& s, int& out) {
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size();
}

static const char* level_tag(harbor::model::HealthLevel l) {
  switch (l) {
    case harbor::model::HealthLevel::Nominal: return "  ";
    case harbor::model::HealthLevel::Elevated: return "! ";
    case harbor::model::HealthLevel::Critical: return "!!";
  }
  return "  ";
}

static void print_reading(const harbor::model::TelemetryReading& r) {
  using harbor::model::MetricKind;
  std::cout << "--- #" << r.seq << (r.stale ? " (stale)" : "") << (r.warming ? " (warming up)" : "");
  if (r.skipped_ticks) std::cout << " skipped=" << r.skipped_ticks;
  std::cout << "\n";
  for (const auto& m : r.health) {
    std::string label = harbor::model::to_string(m.kind);
    if (!m.subject.empty()) label += " " + m.subject;
    std::cout << level_tag(m.level) << " " << std::left << std::setw(28) << label << " ";
    if (m.kind == MetricKind::Temperature) std::cout << std::fixed << std::setprecision(1) << m.value << " C (estimate)";
    else std::cout << harbor::util::format_pct(m.value);
    std::cout << "  " << harbor::model::to_string(m.level) << "\n";
  }
  for (const auto& rt : r.rates) {
    if (rt.unit != harbor::model::Unit::BytesPerSec || !rt.subject.empty()) continue;
    std::cout << "   " << std::left << std::setw(28) << harbor::model::to_string(rt.kind) << " "
              << harbor::util::format_rate(rt.value) << "\n";
  }
  for (const auto& a : r.alerts) std::cout << "  [" << a.severity << "] " << a.message << "\n";
  std::cout.flush();
}

static int cmd_watch(const harbor::app::EngineConfig& cfg, int iterations) {
  harbor::app::TelemetryBuffers buffers(static_cast<size_t>(cfg.sampling.history_capacity));
  harbor::app::Sampler sampler(buffers, harbor::collectors::make_counter_source(), cfg);
  std::atomic<int> printed{0};
  sampler.set_callback([&](const harbor::model::TelemetryReading& r) {
    print_reading(r);
    if (iterations > 0 && printed.fetch_add(1) + 1 >= iterations) g_stop.store(true);
  });
  sampler.start();
  while (!g_stop.load()) std::this_thread::sleep_for(50ms);
  sampler.stop();
  return 0;
}

static void print_entry(const harbor::model::CleanablePath& cp) {
  std::cout << "  " << std::right << std::setw(10) << format_bytes(cp.size_bytes) << "  "
            << std::left << std::setw(22) << cp.label << " " << cp.path;
  if (!cp.reason.empty()) std::cout << "  [" << harbor::model::to_string(cp.protection) << ": " << cp.reason << "]";
  std::cout << "\n";
}

static void print_report(const harbor::model::ScanReport& r) {
  std::cout << "Plan: " << r.plan.size() << " entries, " << format_bytes(r.plan.total_bytes()) << "\n";
  for (const auto& cp : r.plan.paths()) print_entry(cp);
  for (const auto& w : r.plan.warnings()) std::cout << "Warning: " << w << "\n";
  if (!r.excluded.empty()) {
    std::cout << "Kept (" << r.excluded.size() << "):\n";
    for (const auto& cp : r.excluded) print_entry(cp);
  }
  if (!r.unreadable.empty()) {
    std::cout << "Unreadable (" << r.unreadable.size() << "):\n";
    for (const auto& o : r.unreadable) std::cout << "  " << o.path << ": " << o.reason << "\n";
  }
  if (r.cancelled) std::cout << "Scan cancelled; the list is incomplete.\n";
}

static void print_result(const harbor::model::CleanupResult& r) {
  std::cout << "Result: " << harbor::model::to_string(r.status) << "  removed=" << r.removed
            << " skipped=" << r.skipped << " freed=" << format_bytes(r.bytes_freed) << "\n";
  for (const auto& o : r.outcomes) {
    if (o.kind == harbor::model::OutcomeKind::Removed) continue;
    std::cout << "  " << harbor::model::to_string(o.kind) << " " << o.path << ": " << o.reason << "\n";
  }
}

// Runs one job on the service and waits, forwarding Ctrl+C as cancellation.
template <typename Submit>
static bool run_job(harbor::app::CleanupService& svc, harbor::app::JobKind kind, Submit submit) {
  std::atomic<bool> done{false};
  if (submit(done) != harbor::app::SubmitStatus::Accepted) {
    std::fprintf(stderr, "harbor: another %s is already running\n", kind == harbor::app::JobKind::Scan ? "scan" : "cleanup");
    return false;
  }
  bool cancelled = false;
  while (!done.load()) {
    if (g_stop.load() && !cancelled) { svc.cancel(kind); cancelled = true; }
    std::this_thread::sleep_for(20ms);
  }
  svc.wait_idle();
  return true;
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  if (argc < 2) { usage(); return 2; }
  std::string cmd = argv[1];
  std::vector<std::string> pos;
  bool yes = false, ack_running = false, force = false, keep_app = false;
  int iterations = 0, limit = 0;
  std::string sort_key = "cpu", filter;
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--yes" || a == "-y") yes = true;
    else if (a == "--ack-running") ack_running = true;
    else if (a == "--force") force = true;
    else if (a == "--keep-app") keep_app = true;
    else if (a == "--iterations" && i + 1 < argc) { if (!parse_int(argv[++i], iterations)) { usage(); return 2; } }
    else if (a == "--limit" && i + 1 < argc) { if (!parse_int(argv[++i], limit)) { usage(); return 2; } }
    else if (a == "--sort" && i + 1 < argc) sort_key = argv[++i];
    else if (a == "--filter" && i + 1 < argc) filter = argv[++i];
    else if (a == "-h" || a == "--help") { usage(); return 0; }
    else pos.push_back(a);
  }
  if (cmd == "-h" || cmd == "--help" || cmd == "help") { usage(); return 0; }

  auto cfg = harbor::app::load_engine_config();
  if (cmd == "watch") return cmd_watch(cfg, iterations);

  auto procs = harbor::collectors::make_process_source();

  if (cmd == "ps") {
    auto key = harbor::app::ProcessController::parse_sort(sort_key);
    if (!key) { std::fprintf(stderr, "harbor: unknown sort key '%s'\n", sort_key.c_str()); return 2; }
    harbor::app::ProcessController pc(*procs);
    harbor::model::ProcessTable table;
    if (!pc.list_processes(table, *key, filter)) {
      std::fprintf(stderr, "harbor: cannot read the process table\n");
      return 1;
    }
    std::cout << std::left << std::setw(8) << "PID" << std::setw(12) << "USER" << std::right << std::setw(7) << "CPU%"
              << std::setw(11) << "MEM" << "  NAME\n";
    int n = 0;
    for (const auto& p : table.processes) {
      if (limit > 0 && n++ >= limit) break;
      std::cout << std::left << std::setw(8) << p.pid << std::setw(12) << p.user << std::right
                << std::setw(7) << std::fixed << std::setprecision(1) << p.cpu_pct
                << std::setw(11) << format_bytes(p.rss_bytes) << "  " << p.name << (p.is_system ? " (system)" : "") << "\n";
    }
    std::cout << table.processes.size() << " of " << table.total << " processes\n";
    return 0;
  }

  if (cmd == "kill") {
    int pid = 0;
    if (pos.empty() || !parse_int(pos[0], pid)) { usage(); return 2; }
    harbor::app::ProcessController pc(*procs);
    auto r = pc.terminate(pid, force);
    if (!r.error_message.empty()) std::cout << r.error_message << "\n";
    return r.success ? 0 : 1;
  }

  auto layout = harbor::app::HostLayout::current();
  harbor::app::PathPolicy policy(layout, cfg.cleanup.max_depth);
  harbor::app::CleanupJournal journal(cfg.cleanup.journal_dir);
  harbor::app::TrashBin trash(policy.layout());
  harbor::app::ScanPlanner planner(policy, *procs, cfg.cleanup);
  harbor::app::CleanupExecutor executor(policy, trash, *procs, &journal);
  harbor::app::CleanupService service(planner, executor);

  auto execute = [&](const harbor::model::CleanupPlan& plan, harbor::app::Confirmation conf) {
    harbor::model::CleanupResult result;
    run_job(service, harbor::app::JobKind::Execute, [&](std::atomic<bool>& done) {
      return service.execute_async(plan, conf, [&](const harbor::model::CleanupResult& r) { result = r; done.store(true); });
    });
    print_result(result);
    return result.status == harbor::model::ExecuteStatus::Completed ? 0 : 1;
  };

  if (cmd == "scan" || cmd == "clean") {
    if (pos.empty()) { usage(); return 2; }
    auto kind = harbor::app::parse_scan_kind(pos[0]);
    if (!kind) { std::fprintf(stderr, "harbor: unknown scan kind '%s'\n", pos[0].c_str()); return 2; }
    harbor::model::ScanReport report;
    if (!run_job(service, harbor::app::JobKind::Scan, [&](std::atomic<bool>& done) {
          return service.scan_async(*kind, [&](const harbor::model::ScanReport& r) { report = r; done.store(true); });
        })) return 1;
    print_report(report);
    if (cmd == "scan" || report.cancelled) return 0;
    if (!yes) std::cout << "Nothing moved. Re-run with --yes to move these entries to the trash.\n";
    return execute(report.plan, {yes, false});
  }

  auto live = harbor::app::LiveState::capture(*procs);
  harbor::app::AppCatalog catalog(policy);
  harbor::app::LeftoverResolver resolver(policy);

  if (cmd == "apps") {
    for (const auto& app : catalog.list_apps(live)) {
      std::cout << "  " << std::right << std::setw(10) << format_bytes(app.bundle_bytes) << "  "
                << std::left << std::setw(28) << app.display_name << " " << app.bundle_id
                << (app.version.empty() ? "" : " " + app.version) << (app.is_running ? " (running)" : "") << "\n";
    }
    return 0;
  }

  if (cmd == "leftovers") {
    if (pos.empty()) { usage(); return 2; }
    auto app = catalog.find(pos[0], live);
    std::vector<harbor::model::PathOutcome> unreadable;
    auto items = resolver.resolve(pos[0], app ? app->display_name : std::string(), live, &unreadable);
    uint64_t total = 0;
    for (const auto& cp : items) { print_entry(cp); total += cp.size_bytes; }
    std::cout << items.size() << " entries, " << format_bytes(total) << "\n";
    for (const auto& o : unreadable) std::cout << "  unreadable " << o.path << ": " << o.reason << "\n";
    return 0;
  }

  if (cmd == "uninstall") {
    if (pos.empty()) { usage(); return 2; }
    auto app = catalog.find(pos[0], live);
    if (!app) { std::fprintf(stderr, "harbor: no removable application with id '%s'\n", pos[0].c_str()); return 1; }
    auto report = keep_app ? resolver.plan_reset(*app, live) : resolver.plan_uninstall(*app, live);
    print_report(report);
    if (!yes) std::cout << "Nothing moved. Re-run with --yes to move these entries to the trash.\n";
    return execute(report.plan, {yes, ack_running});
  }

  if (cmd == "startup") {
    harbor::app::LaunchctlControl launchctl;
    harbor::app::StartupItems startup(policy, launchctl);
    auto items = startup.list();
    if (pos.empty()) {
      for (const auto& it : items) {
        std::cout << "  " << (it.enabled() ? "on " : "off") << "  " << std::left << std::setw(14)
                  << harbor::model::to_string(it.kind) << std::setw(24) << it.name << " " << it.label
                  << (startup.modifiable(it) ? "" : " (read-only)") << "\n";
      }
      std::cout << items.size() << " startup items\n";
      return 0;
    }
    if (pos.size() < 2) { usage(); return 2; }
    auto found = std::find_if(items.begin(), items.end(), [&](const auto& it) { return it.label == pos[1]; });
    if (found == items.end()) { std::fprintf(stderr, "harbor: no startup item labelled '%s'\n", pos[1].c_str()); return 1; }
    std::string err;
    if (pos[0] == "enable" || pos[0] == "disable") {
      if (!startup.set_disabled(*found, pos[0] == "disable", err)) { std::cout << err << "\n"; return 1; }
      std::cout << found->name << " " << pos[0] << "d\n";
      return 0;
    }
    if (pos[0] == "remove") {
      if (!yes) std::cout << "Nothing moved. Re-run with --yes to move " << found->path << " to the trash.\n";
      harbor::model::CleanupResult result;
      if (!startup.remove(*found, live, executor, {yes, false}, result, err)) { std::cout << err << "\n"; return 1; }
      print_result(result);
      return result.status == harbor::model::ExecuteStatus::Completed ? 0 : 1;
    }
    usage();
    return 2;
  }

  usage();
  return 2;
}
