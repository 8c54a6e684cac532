#include "app/CleanupExecutor.hpp"

#include <cstdio>

using harbor::model::CleanablePath;
using harbor::model::CleanupPlan;
using harbor::model::CleanupResult;
using harbor::model::ExecuteStatus;
using harbor::model::OutcomeKind;
using harbor::model::PathOutcome;
using harbor::model::Protection;

namespace harbor::app {

CleanupExecutor::CleanupExecutor(const PathPolicy& policy, TrashBin& trash,
                                 harbor::collectors::IProcessSource& procs, CleanupJournal* journal)
  : policy_(policy), trash_(trash), procs_(procs), journal_(journal) {}

PathOutcome CleanupExecutor::apply(const CleanablePath& cp, const LiveState& live) {
  PathOutcome o;
  o.path = cp.path;
  o.bytes = cp.size_bytes;

  CleanablePath now;
  std::string err;
  if (!policy_.inspect(cp.path, cp.category, live, now, err, cp.owner)) {
    o.kind = OutcomeKind::SkippedError;
    o.reason = err == "vanished" ? std::string("vanished since scan") : err;
    return o;
  }
  if (!(now.identity == cp.identity)) {
    o.kind = OutcomeKind::SkippedError;
    o.reason = "changed since scan";
    return o;
  }
  if (now.protection != Protection::Deletable) {
    o.kind = OutcomeKind::SkippedProtected;
    o.reason = now.reason;
    return o;
  }

  auto moved = trash_.move_to_trash(cp.path);
  if (!moved.ok) {
    o.kind = OutcomeKind::SkippedError;
    o.reason = moved.error;
    return o;
  }
  o.kind = OutcomeKind::Removed;
  o.bytes = now.size_bytes;
  o.trashed_to = moved.trashed_to;
  return o;
}

CleanupResult CleanupExecutor::execute(const CleanupPlan& plan, Confirmation conf, std::stop_token st) {
  CleanupResult res;
  if (!conf.confirmed) {
    res.status = ExecuteStatus::ConfirmationMissing;
    return res;
  }
  if (!plan.warnings().empty() && !conf.warnings_acknowledged) {
    res.status = ExecuteStatus::WarningsNotAcknowledged;
    return res;
  }

  if (journal_) {
    journal_->note("execute " + std::to_string(plan.size()) + " paths, " +
                   std::to_string(plan.total_bytes()) + " bytes planned");
  }

  LiveState live = LiveState::capture(procs_);
  res.outcomes.reserve(plan.size());
  bool cancelled = false;
  for (const auto& cp : plan.paths()) {
    PathOutcome o;
    if (!cancelled && st.stop_requested()) cancelled = true;
    if (cancelled) {
      o.path = cp.path;
      o.kind = OutcomeKind::SkippedError;
      o.reason = "cancelled";
    } else {
      o = apply(cp, live);
    }
    if (o.kind == OutcomeKind::Removed) {
      ++res.removed;
      res.bytes_freed += o.bytes;
    } else {
      ++res.skipped;
      if (o.kind == OutcomeKind::SkippedError && o.reason != "cancelled") {
        std::fprintf(stderr, "harbor: CleanupExecutor: %s: %s\n", o.path.c_str(), o.reason.c_str());
      }
    }
    if (journal_) journal_->record(o);
    res.outcomes.push_back(std::move(o));
  }
  res.status = cancelled ? ExecuteStatus::Cancelled : ExecuteStatus::Completed;
  return res;
}

} // namespace harbor::app
