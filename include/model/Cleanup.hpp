#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace harbor::model {

enum class Category { BrowserCache, AppCache, SystemLog, Tmp, AppLeftover, AppBundle, Installer, StartupItem };
enum class Protection { Deletable, Protected, InUse };
enum class EntryKind { File, Directory, Other };

// Identity captured at scan time so the executor can tell a path that was
// replaced between review and execution from the one the user approved.
struct PathIdentity {
  uint64_t device{};
  uint64_t inode{};
  EntryKind kind{EntryKind::Other};
  bool operator==(const PathIdentity&) const = default;
};

struct CleanablePath {
  std::string path;        // absolute
  uint64_t size_bytes{};
  Category category{Category::AppCache};
  Protection protection{Protection::Deletable};
  std::string reason;      // why the entry is protected or in use
  std::string label;       // human name of the root it came from
  std::string owner;       // bundle id whose running instance puts the entry in use
  PathIdentity identity{};
};

// Reviewable intent. Construction goes through make_plan(), which drops any
// entry that is not Deletable, so a plan never carries one.
class CleanupPlan {
public:
  CleanupPlan() = default;

  const std::vector<CleanablePath>& paths() const { return paths_; }
  uint64_t total_bytes() const { return total_bytes_; }
  const std::vector<std::string>& warnings() const { return warnings_; }
  bool empty() const { return paths_.empty(); }
  size_t size() const { return paths_.size(); }

  friend CleanupPlan make_plan(std::vector<CleanablePath> candidates, std::vector<std::string> warnings);

private:
  std::vector<CleanablePath> paths_;
  uint64_t total_bytes_{};
  std::vector<std::string> warnings_;
};

CleanupPlan make_plan(std::vector<CleanablePath> candidates, std::vector<std::string> warnings = {});

enum class OutcomeKind { Removed, SkippedProtected, SkippedError };

struct PathOutcome {
  std::string path;
  OutcomeKind kind{OutcomeKind::SkippedError};
  uint64_t bytes{};
  std::string reason;
  std::string trashed_to;
};

enum class ExecuteStatus { Completed, ConfirmationMissing, WarningsNotAcknowledged, Cancelled };

struct CleanupResult {
  ExecuteStatus status{ExecuteStatus::Completed};
  std::vector<PathOutcome> outcomes;
  uint64_t bytes_freed{};
  size_t removed{};
  size_t skipped{};
};

// Everything a scan saw. The plan holds the deletable entries; the rest are
// listed so nothing enumerated disappears from view.
struct ScanReport {
  CleanupPlan plan;
  std::vector<CleanablePath> excluded;  // protected or in use
  std::vector<PathOutcome> unreadable;  // SkippedError with the reason
  bool cancelled{false};
};

struct AppRecord {
  std::string bundle_id;
  std::string display_name;
  std::string install_path;
  std::string version;
  uint64_t bundle_bytes{};
  bool is_running{false};
  std::vector<CleanablePath> leftovers;
};

const char* to_string(Category c);
const char* to_string(Protection p);
const char* to_string(OutcomeKind k);
const char* to_string(ExecuteStatus s);

} // namespace harbor::model
