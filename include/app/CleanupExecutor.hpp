#pragma once
#include <stop_token>
#include "app/CleanupJournal.hpp"
#include "app/PathPolicy.hpp"
#include "app/TrashBin.hpp"
#include "collectors/IProcessSource.hpp"
#include "model/Cleanup.hpp"

namespace harbor::app {

struct Confirmation {
  bool confirmed{false};
  bool warnings_acknowledged{false};
};

// Carries out a reviewed plan. It never chooses what to remove: every path
// comes from the plan and is re-verified against the disk just before the
// move. Each path gets exactly one outcome.
class CleanupExecutor {
public:
  CleanupExecutor(const PathPolicy& policy, TrashBin& trash, harbor::collectors::IProcessSource& procs,
                  CleanupJournal* journal = nullptr);

  harbor::model::CleanupResult execute(const harbor::model::CleanupPlan& plan, Confirmation conf,
                                       std::stop_token st = {});

private:
  harbor::model::PathOutcome apply(const harbor::model::CleanablePath& cp, const LiveState& live);

  const PathPolicy& policy_;
  TrashBin& trash_;
  harbor::collectors::IProcessSource& procs_;
  CleanupJournal* journal_;
};

} // namespace harbor::app
