#pragma once
#include <sys/types.h>
#include <filesystem>
#include <string>
#include <vector>

namespace harbor::app {

// Where the cleanup engine is allowed to look and where removed entries go.
// All paths are canonical (symlinks such as /var -> /private/var resolved).
struct HostLayout {
  std::filesystem::path home;
  std::filesystem::path trash_dir;       // ~/.Trash, or XDG Trash/files
  std::filesystem::path trash_info_dir;  // XDG Trash/info; empty when the trash keeps no metadata
  std::vector<std::filesystem::path> temp_roots;
  std::vector<std::filesystem::path> app_roots;  // /Applications, ~/Applications
  std::filesystem::path system_library;          // /Library
  uid_t uid{};
  std::string self_bundle_id{"io.harbor.Harbor"};

  std::filesystem::path library() const { return home / "Library"; }
  std::filesystem::path downloads() const { return home / "Downloads"; }

  // The running user's layout
  static HostLayout current();
  // Everything beneath root (home = root/home, temp = root/tmp, ...)
  static HostLayout under(const std::filesystem::path& root);
};

} // namespace harbor::app
