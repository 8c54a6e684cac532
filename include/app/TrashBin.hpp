#pragma once
#include <functional>
#include <string>
#include "app/HostLayout.hpp"

namespace harbor::app {

struct TrashResult {
  bool ok{false};
  std::string trashed_to;
  std::string error;
};

// Moves entries into the user's trash with a single rename(2). Nothing is
// ever unlinked; an entry on another volume is refused instead of copied.
// The rename never replaces an existing trash entry: when the chosen name is
// taken between the lookup and the move, another name is picked.
class TrashBin {
public:
  explicit TrashBin(const HostLayout& layout) : layout_(layout) {}

  TrashResult move_to_trash(const std::string& path);

  static constexpr int kRenameAttempts = 8;

#ifdef HARBOR_TESTING
  // Runs after a destination name is chosen and before the rename.
  void test_before_rename(std::function<void(const std::string&)> fn) { before_rename_ = std::move(fn); }
#endif

private:
  std::string free_name(const std::string& base) const;
  bool write_info(const std::string& name, const std::string& original, std::string& err) const;

  const HostLayout& layout_;
#ifdef HARBOR_TESTING
  std::function<void(const std::string&)> before_rename_;
#endif
};

} // namespace harbor::app
