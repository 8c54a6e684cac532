#include "app/CleanupService.hpp"

namespace harbor::app {

CleanupService::~CleanupService() {
  cancel(JobKind::Scan);
  cancel(JobKind::Execute);
  wait_idle();
}

bool CleanupService::claim(Slot& s) {
  bool expected = false;
  if (!s.running.compare_exchange_strong(expected, true)) return false;
  // The previous job has finished; reap its thread before reusing the slot.
  if (s.thread.joinable()) s.thread.join();
  return true;
}

SubmitStatus CleanupService::scan_async(ScanKind kind, ScanCallback cb) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!claim(scan_)) return SubmitStatus::Busy;
  scan_.thread = std::jthread([this, kind, cb = std::move(cb)](std::stop_token st) {
    auto report = planner_.scan(kind, st);
    if (cb) cb(report);
    scan_.running.store(false);
  });
  return SubmitStatus::Accepted;
}

SubmitStatus CleanupService::execute_async(harbor::model::CleanupPlan plan, Confirmation conf, ExecuteCallback cb) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!claim(exec_)) return SubmitStatus::Busy;
  exec_.thread = std::jthread([this, plan = std::move(plan), conf, cb = std::move(cb)](std::stop_token st) {
    auto result = executor_.execute(plan, conf, st);
    if (cb) cb(result);
    exec_.running.store(false);
  });
  return SubmitStatus::Accepted;
}

void CleanupService::cancel(JobKind kind) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& s = slot(kind);
  if (s.thread.joinable()) s.thread.request_stop();
}

bool CleanupService::busy(JobKind kind) const { return slot(kind).running.load(); }

void CleanupService::wait_idle() {
  std::lock_guard<std::mutex> lk(mu_);
  if (scan_.thread.joinable()) scan_.thread.join();
  if (exec_.thread.joinable()) exec_.thread.join();
}

} // namespace harbor::app
