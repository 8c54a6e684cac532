#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "app/CleanupExecutor.hpp"
#include "app/LaunchControl.hpp"
#include "app/LiveState.hpp"
#include "app/PathPolicy.hpp"
#include "model/Cleanup.hpp"
#include "model/Startup.hpp"

namespace harbor::app {

// launchd jobs from ~/Library/LaunchAgents, /Library/LaunchAgents and
// /Library/LaunchDaemons. Only the user's own launch agents can be
// disabled, enabled or removed; system jobs are listed read-only.
class StartupItems {
public:
  StartupItems(const PathPolicy& policy, ILaunchControl& launchd) : policy_(policy), launchd_(launchd) {}

  // User agents first, then system agents, then system daemons; each folder
  // sorted by path. Files that are not dictionary plists are skipped.
  std::vector<harbor::model::StartupItem> list() const;

  bool modifiable(const harbor::model::StartupItem& item) const;

  // Rewrites the Disabled key of an XML plist in place, then unloads or loads
  // the job. A launchctl failure is logged; the plist change stands.
  bool set_disabled(const harbor::model::StartupItem& item, bool disabled, std::string& err);

  // Unloads the job and hands its plist to the executor as a one-entry plan,
  // so it goes to the trash and into the journal like any other cleanup.
  bool remove(const harbor::model::StartupItem& item, const LiveState& live, CleanupExecutor& exec,
              Confirmation conf, harbor::model::CleanupResult& out, std::string& err);

  static std::string friendly_name(std::string_view label, std::string_view program);

  // xml with the top-level Disabled key set; nullopt if xml is not a
  // dictionary plist or Disabled holds something other than a boolean.
  static std::optional<std::string> with_disabled(std::string_view xml, bool disabled);

private:
  void read_folder(const std::filesystem::path& dir, harbor::model::StartupKind kind,
                   harbor::model::StartupScope scope, std::vector<harbor::model::StartupItem>& out) const;

  const PathPolicy& policy_;
  ILaunchControl& launchd_;
};

} // namespace harbor::app
