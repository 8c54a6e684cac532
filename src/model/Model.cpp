#include "model/Metrics.hpp"
#include "model/Cleanup.hpp"
#include "model/Startup.hpp"

namespace harbor::model {

const char* to_string(MetricKind k) {
  switch (k) {
    case MetricKind::CpuTotal:    return "cpu";
    case MetricKind::CpuCore:     return "cpu.core";
    case MetricKind::MemoryUsed:  return "memory";
    case MetricKind::VolumeUsed:  return "volume";
    case MetricKind::NetRx:       return "net.rx";
    case MetricKind::NetTx:       return "net.tx";
    case MetricKind::DiskRead:    return "disk.read";
    case MetricKind::DiskWrite:   return "disk.write";
    case MetricKind::Temperature: return "temperature";
  }
  return "?";
}

const char* to_string(Unit u) {
  switch (u) {
    case Unit::Percent:     return "%";
    case Unit::BytesPerSec: return "B/s";
    case Unit::Celsius:     return "C";
  }
  return "?";
}

const char* to_string(HealthLevel l) {
  switch (l) {
    case HealthLevel::Nominal:  return "nominal";
    case HealthLevel::Elevated: return "elevated";
    case HealthLevel::Critical: return "critical";
  }
  return "?";
}

const char* to_string(Category c) {
  switch (c) {
    case Category::BrowserCache: return "browserCache";
    case Category::AppCache:     return "appCache";
    case Category::SystemLog:    return "systemLog";
    case Category::Tmp:          return "tmp";
    case Category::AppLeftover:  return "appLeftover";
    case Category::AppBundle:    return "appBundle";
    case Category::Installer:    return "installer";
    case Category::StartupItem:  return "startupItem";
  }
  return "?";
}

const char* to_string(Protection p) {
  switch (p) {
    case Protection::Deletable: return "deletable";
    case Protection::Protected: return "protected";
    case Protection::InUse:     return "inUse";
  }
  return "?";
}

const char* to_string(OutcomeKind k) {
  switch (k) {
    case OutcomeKind::Removed:          return "removed";
    case OutcomeKind::SkippedProtected: return "skipped-protected";
    case OutcomeKind::SkippedError:     return "skipped-error";
  }
  return "?";
}

const char* to_string(ExecuteStatus s) {
  switch (s) {
    case ExecuteStatus::Completed:               return "completed";
    case ExecuteStatus::ConfirmationMissing:     return "confirmation-missing";
    case ExecuteStatus::WarningsNotAcknowledged: return "warnings-not-acknowledged";
    case ExecuteStatus::Cancelled:               return "cancelled";
  }
  return "?";
}

const char* to_string(StartupKind k) {
  switch (k) {
    case StartupKind::LaunchAgent:  return "Launch Agent";
    case StartupKind::LaunchDaemon: return "Launch Daemon";
  }
  return "?";
}

CleanupPlan make_plan(std::vector<CleanablePath> candidates, std::vector<std::string> warnings) {
  CleanupPlan plan;
  plan.paths_.reserve(candidates.size());
  for (auto& c : candidates) {
    if (c.protection != Protection::Deletable) continue;
    plan.total_bytes_ += c.size_bytes;
    plan.paths_.push_back(std::move(c));
  }
  plan.warnings_ = std::move(warnings);
  return plan;
}

} // namespace harbor::model
