#include "app/HostLayout.hpp"

#include <unistd.h>
#include <pwd.h>

#include <cstdio>
#include <cstdlib>

namespace fs = std::filesystem;

namespace harbor::app {

static fs::path canonical_or_self(const fs::path& p) {
  std::error_code ec;
  auto c = fs::weakly_canonical(p, ec);
  return ec ? p.lexically_normal() : c;
}

static fs::path home_dir() {
  if (const char* h = std::getenv("HOME"); h && *h) return h;
  struct passwd pw{};
  struct passwd* res = nullptr;
  char buf[4096];
  if (::getpwuid_r(::getuid(), &pw, buf, sizeof(buf), &res) == 0 && res && res->pw_dir) return res->pw_dir;
  std::fprintf(stderr, "harbor: HostLayout: cannot determine home directory\n");
  return {};
}

HostLayout HostLayout::current() {
  HostLayout l;
  l.uid = ::getuid();
  l.home = canonical_or_self(home_dir());
#ifdef __APPLE__
  l.trash_dir = l.home / ".Trash";
#else
  fs::path data = l.home / ".local/share";
  if (const char* x = std::getenv("XDG_DATA_HOME"); x && *x) data = x;
  l.trash_dir = canonical_or_self(data / "Trash/files");
  l.trash_info_dir = canonical_or_self(data / "Trash/info");
#endif
  l.temp_roots.push_back(canonical_or_self("/tmp"));
  std::error_code ec;
  auto tmp = fs::temp_directory_path(ec);
  if (!ec) {
    auto c = canonical_or_self(tmp);
    if (c != l.temp_roots.front()) l.temp_roots.push_back(c);
  }
  l.app_roots = {canonical_or_self("/Applications"), l.home / "Applications"};
  l.system_library = canonical_or_self("/Library");
  return l;
}

HostLayout HostLayout::under(const fs::path& root) {
  HostLayout l;
  auto r = canonical_or_self(root);
  l.uid = ::getuid();
  l.home = r / "home";
  l.trash_dir = l.home / ".Trash";
  l.temp_roots = {r / "tmp"};
  l.app_roots = {r / "Applications", l.home / "Applications"};
  l.system_library = r / "Library";
  return l;
}

} // namespace harbor::app
