#include "app/PathPolicy.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>

namespace fs = std::filesystem;

using harbor::model::Category;
using harbor::model::CleanablePath;
using harbor::model::EntryKind;
using harbor::model::PathIdentity;
using harbor::model::Protection;

namespace harbor::app {

// Relative to home; the folder itself is never a candidate.
static constexpr std::array<std::string_view, 22> kProtectedHomeFolders = {
  "Library", "Library/Caches", "Library/Preferences", "Library/Application Support",
  "Library/Logs", "Library/Containers", "Library/Group Containers",
  "Library/Saved Application State", "Library/LaunchAgents", "Library/HTTPStorages",
  "Library/WebKit", "Library/Cookies", "Applications", "Documents", "Desktop",
  "Downloads", "Movies", "Music", "Pictures", "Public", ".Trash", ".cache",
};

// Relative to home; nothing at or beneath these is ever touched.
static constexpr std::array<std::string_view, 5> kProtectedHomeTrees = {
  "Library/Keychains", "Library/Mobile Documents", "Library/CloudStorage",
  "Library/Mail", ".Trash",
};

// Directories under ~/Library/Caches that belong to the system.
static constexpr std::array<std::string_view, 11> kSystemCacheNames = {
  "CloudKit", "com.apple.nsurlsessiond", "com.apple.HomeKit", "com.apple.bird",
  "com.apple.iCloudHelper", "com.apple.ap.adprivacyd", "com.apple.parsecd",
  "com.apple.accountsd", "com.apple.appstored", "com.apple.commerce",
  "com.apple.containermanagerd",
};

static constexpr std::array<std::string_view, 6> kSystemPrefixes = {
  "/System", "/usr", "/bin", "/sbin", "/private/var/db", "/Library/Apple",
};

PathPolicy::PathPolicy(HostLayout layout, int max_depth)
  : layout_(std::move(layout)), max_depth_(std::clamp(max_depth, 1, 64)) {}

bool PathPolicy::is_under(const std::string& path, const std::string& root) {
  if (root.empty() || path.size() <= root.size()) return false;
  if (path.compare(0, root.size(), root) != 0) return false;
  return root.back() == '/' || path[root.size()] == '/';
}

const fs::path* PathPolicy::area_root(const std::string& path) const {
  for (const auto& t : layout_.temp_roots) if (is_under(path, t.string())) return &t;
  if (is_under(path, layout_.home.string())) return &layout_.home;
  return nullptr;
}

bool PathPolicy::under_temp(const std::string& path) const {
  for (const auto& t : layout_.temp_roots) if (is_under(path, t.string())) return true;
  return false;
}

bool PathPolicy::in_allowed_area(const std::string& path) const { return area_root(path) != nullptr; }

std::optional<std::string> PathPolicy::denied(const std::string& path, Category cat) const {
  for (auto pre : kSystemPrefixes) {
    std::string p(pre);
    if (path == p || is_under(path, p)) return std::string("system location");
  }

  if (cat == Category::AppBundle) {
    fs::path p(path);
    if (p.extension() != ".app") return std::string("not an application bundle");
    for (const auto& r : layout_.app_roots) {
      if (p.parent_path() == r) return std::nullopt;
    }
    return std::string("outside the application folders");
  }

  const fs::path* root = area_root(path);
  if (!root) return std::string("outside the home directory");

  fs::path rel = fs::path(path).lexically_relative(*root);
  std::string rel_s = rel.generic_string();
  if (*root == layout_.home) {
    for (auto f : kProtectedHomeFolders) if (rel_s == f) return std::string("protected folder");
    for (auto t : kProtectedHomeTrees) {
      std::string ts(t);
      if (rel_s == ts || is_under(rel_s, ts)) return std::string("protected folder");
    }
  }

  for (const auto& comp : rel) {
    auto c = comp.string();
    if (c.size() > 1 && c[0] == '.' && c != ".cache") return std::string("hidden entry");
    if (comp.extension() == ".app") return std::string("application bundle");
  }

  if (*root == layout_.home) {
    std::string caches = "Library/Caches";
    if (is_under(rel_s, caches)) {
      auto first = rel_s.substr(caches.size() + 1);
      first = first.substr(0, first.find('/'));
      for (auto n : kSystemCacheNames) if (first == n) return std::string("system cache");
    }
  }
  return std::nullopt;
}

static EntryKind kind_of(mode_t m) {
  if (S_ISREG(m)) return EntryKind::File;
  if (S_ISDIR(m)) return EntryKind::Directory;
  return EntryKind::Other;
}

std::optional<PathIdentity> PathPolicy::identity_of(const std::string& path) {
  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) return std::nullopt;
  PathIdentity id;
  id.device = static_cast<uint64_t>(st.st_dev);
  id.inode = static_cast<uint64_t>(st.st_ino);
  id.kind = kind_of(st.st_mode);
  return id;
}

bool PathPolicy::inspect(const std::string& path, Category cat, const LiveState& live,
                         CleanablePath& out, std::string& err, const std::string& owner) const {
  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    err = (errno == ENOENT || errno == ENOTDIR) ? std::string("vanished") : std::string(std::strerror(errno));
    return false;
  }
  out.path = path;
  out.category = cat;
  out.owner = owner;
  out.identity.device = static_cast<uint64_t>(st.st_dev);
  out.identity.inode = static_cast<uint64_t>(st.st_ino);
  out.identity.kind = kind_of(st.st_mode);
  out.protection = Protection::Deletable;
  out.reason.clear();

  auto protect = [&](std::string why) { out.protection = Protection::Protected; out.reason = std::move(why); };

  if (S_ISLNK(st.st_mode)) {
    protect("symbolic link");
    out.size_bytes = 0;
    return true;
  }
  out.size_bytes = S_ISDIR(st.st_mode) ? size_of(path)
                 : (S_ISREG(st.st_mode) ? static_cast<uint64_t>(st.st_size) : 0);

  if (auto why = denied(path, cat)) { protect(*why); return true; }
  if (under_temp(path) && st.st_uid != layout_.uid) { protect("owned by another user"); return true; }

  if (cat == Category::AppBundle) {
    if (live.exe_under(path)) {
      out.protection = Protection::InUse;
      out.reason = "application is running";
      return true;
    }
    auto parent = fs::path(path).parent_path().string();
    if (::access(parent.c_str(), W_OK) != 0) { protect("requires administrator privileges"); return true; }
  }

  if (live.open_at_or_under(path)) {
    out.protection = Protection::InUse;
    out.reason = "open by a running process";
    return true;
  }
  if (!owner.empty() && live.bundle_running(owner)) {
    out.protection = Protection::InUse;
    out.reason = owner + " is running";
    return true;
  }
  return true;
}

uint64_t PathPolicy::size_of(const std::string& path) const {
  std::error_code ec;
  auto st = fs::symlink_status(path, ec);
  if (ec) return 0;
  if (fs::is_regular_file(st)) {
    auto sz = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(sz);
  }
  if (!fs::is_directory(st)) return 0;

  uint64_t total = 0;
  fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
  fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    auto est = it->symlink_status(ec);
    if (!ec && fs::is_regular_file(est)) {
      auto sz = it->file_size(ec);
      if (!ec) total += static_cast<uint64_t>(sz);
    }
    if (it.depth() + 1 >= max_depth_) it.disable_recursion_pending();
    ec.clear();
    it.increment(ec);
  }
  return total;
}

} // namespace harbor::app
