#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "app/AppCatalog.hpp"
#include "app/LiveState.hpp"
#include "app/PathPolicy.hpp"
#include "model/Cleanup.hpp"

namespace harbor::app {

enum class LeftoverScope { User, System };

struct LeftoverLocation {
  std::string label;
  LeftoverScope scope;
  std::string rel;          // under ~/Library (User) or /Library (System)
  bool match_display_name;  // exact display-name folders also belong to the app
  bool group_style;         // "<team>.<id>" and "group.<id>" names
};

const std::vector<LeftoverLocation>& leftover_locations();

// Maps an application identity to the artifacts it left outside its bundle.
class LeftoverResolver {
public:
  explicit LeftoverResolver(const PathPolicy& policy) : policy_(policy) {}

  // Every artifact of bundle_id, sorted by path. System-scope matches are
  // reported Protected. Entries that could not be examined go to unreadable
  // when it is given.
  std::vector<harbor::model::CleanablePath> resolve(std::string_view bundle_id, std::string_view display_name,
                                                    const LiveState& live,
                                                    std::vector<harbor::model::PathOutcome>* unreadable = nullptr) const;

  // Preference files and support folders whose app is no longer installed.
  std::vector<harbor::model::CleanablePath> orphans(const InstalledIndex& installed, const LiveState& live,
                                                    std::vector<harbor::model::PathOutcome>* unreadable = nullptr) const;

  // Bundle (when include_bundle) plus deletable leftovers; a running app adds
  // a warning that must be acknowledged before execution.
  harbor::model::ScanReport plan_uninstall(const harbor::model::AppRecord& app, const LiveState& live,
                                           bool include_bundle = true) const;
  harbor::model::ScanReport plan_reset(const harbor::model::AppRecord& app, const LiveState& live) const {
    return plan_uninstall(app, live, false);
  }

  // name (after .plist/.savedState/.binarycookies is dropped) is bundle_id or
  // a reverse-DNS child of it. Case-insensitive; substrings never match.
  static bool matches_identifier(std::string_view name, std::string_view bundle_id, bool group_style = false);
  static std::string strip_known_suffix(std::string_view name);

  static constexpr uint64_t kOrphanPrefMinBytes = 10 * 1024;
  static constexpr uint64_t kOrphanSupportMinBytes = 5 * 1024 * 1024;

private:
  bool add(const std::filesystem::path& p, const std::string& label, bool system_scope, const LiveState& live,
           std::vector<harbor::model::CleanablePath>& out, std::vector<harbor::model::PathOutcome>* unreadable) const;

  const PathPolicy& policy_;
};

} // namespace harbor::app
