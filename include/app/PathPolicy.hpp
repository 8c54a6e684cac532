#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "app/HostLayout.hpp"
#include "app/LiveState.hpp"
#include "model/Cleanup.hpp"

namespace harbor::app {

// Classifies a single filesystem entry as deletable, protected or in use.
// Shared by the scan planner and by the executor's re-verification so both
// sides apply identical rules.
class PathPolicy {
public:
  explicit PathPolicy(HostLayout layout, int max_depth = 16);

  const HostLayout& layout() const { return layout_; }
  int max_depth() const { return max_depth_; }

  // Strictly beneath the home directory or one of the temp roots.
  bool in_allowed_area(const std::string& path) const;

  // Static denylist verdict for a path, independent of live state.
  std::optional<std::string> denied(const std::string& path, harbor::model::Category cat) const;

  // lstat the entry and classify it. False (with err set) when the entry
  // cannot be stat'd; err is "vanished" for ENOENT.
  bool inspect(const std::string& path, harbor::model::Category cat, const LiveState& live,
               harbor::model::CleanablePath& out, std::string& err, const std::string& owner = {}) const;

  // Logical size of regular files at or beneath path; symlinks are not followed.
  uint64_t size_of(const std::string& path) const;

  // Current identity of path without following a final symlink.
  static std::optional<harbor::model::PathIdentity> identity_of(const std::string& path);

  static bool is_under(const std::string& path, const std::string& root);

private:
  const std::filesystem::path* area_root(const std::string& path) const;
  bool under_temp(const std::string& path) const;

  HostLayout layout_;
  int max_depth_;
};

} // namespace harbor::app
