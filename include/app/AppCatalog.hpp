#pragma once
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "app/LiveState.hpp"
#include "app/PathPolicy.hpp"
#include "model/Cleanup.hpp"

namespace harbor::app {

// Every bundle found in the application folders, system ones included.
// Used to decide whether a preference or support folder still has an owner.
struct InstalledIndex {
  std::set<std::string> bundle_ids;  // lowercase
  std::set<std::string> names;       // lowercase bundle names and last id components
};

class AppCatalog {
public:
  explicit AppCatalog(const PathPolicy& policy) : policy_(policy) {}

  // Removable apps from the application folders, sorted by display name.
  std::vector<harbor::model::AppRecord> list_apps(const LiveState& live, bool with_sizes = true) const;
  std::optional<harbor::model::AppRecord> find(std::string_view bundle_id, const LiveState& live) const;
  InstalledIndex installed() const;

  static bool is_system_app(std::string_view name, std::string_view bundle_id);

private:
  std::vector<std::filesystem::path> bundles() const;

  const PathPolicy& policy_;
};

} // namespace harbor::app
