#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include "app/CleanupExecutor.hpp"
#include "app/ScanPlanner.hpp"

namespace harbor::app {

enum class JobKind { Scan, Execute };
enum class SubmitStatus { Accepted, Busy };

// One background job per kind. A second request of a kind that is still
// running is rejected rather than queued.
class CleanupService {
public:
  using ScanCallback = std::function<void(const harbor::model::ScanReport&)>;
  using ExecuteCallback = std::function<void(const harbor::model::CleanupResult&)>;

  CleanupService(ScanPlanner& planner, CleanupExecutor& executor) : planner_(planner), executor_(executor) {}
  ~CleanupService();
  CleanupService(const CleanupService&) = delete;
  CleanupService& operator=(const CleanupService&) = delete;

  SubmitStatus scan_async(ScanKind kind, ScanCallback cb);
  SubmitStatus execute_async(harbor::model::CleanupPlan plan, Confirmation conf, ExecuteCallback cb);

  void cancel(JobKind kind);
  bool busy(JobKind kind) const;
  void wait_idle();

private:
  struct Slot {
    std::atomic<bool> running{false};
    std::jthread thread;
  };
  Slot& slot(JobKind k) { return k == JobKind::Scan ? scan_ : exec_; }
  const Slot& slot(JobKind k) const { return k == JobKind::Scan ? scan_ : exec_; }
  bool claim(Slot& s);

  ScanPlanner& planner_;
  CleanupExecutor& executor_;
  Slot scan_;
  Slot exec_;
  std::mutex mu_;
};

} // namespace harbor::app
