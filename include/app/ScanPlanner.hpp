#pragma once
#include <stop_token>
#include "app/CacheRoots.hpp"
#include "app/Config.hpp"
#include "app/LiveState.hpp"
#include "app/PathPolicy.hpp"
#include "collectors/IProcessSource.hpp"
#include "model/Cleanup.hpp"

namespace harbor::app {

// Walks the cache table (or the leftover locations) and sorts every entry it
// sees into the plan, the excluded list or the unreadable list.
class ScanPlanner {
public:
  ScanPlanner(const PathPolicy& policy, harbor::collectors::IProcessSource& procs, CleanupConfig cfg = {});

  harbor::model::ScanReport scan(ScanKind kind, std::stop_token st = {});

  // Single row of the table, for callers that bring their own live state.
  void scan_root(const CacheRoot& root, const LiveState& live, harbor::model::ScanReport& report,
                 std::vector<harbor::model::CleanablePath>& candidates, std::stop_token st) const;

private:
  bool old_enough(const std::filesystem::path& p, AgeRule age) const;
  void consider(const std::filesystem::path& p, const CacheRoot& root, const LiveState& live,
                harbor::model::ScanReport& report, std::vector<harbor::model::CleanablePath>& candidates) const;

  const PathPolicy& policy_;
  harbor::collectors::IProcessSource& procs_;
  CleanupConfig cfg_;
};

} // namespace harbor::app
