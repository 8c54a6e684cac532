#include "app/TrashBin.hpp"

#include <fcntl.h>
#include <stdio.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace harbor::app {

std::string TrashBin::free_name(const std::string& base) const {
  std::error_code ec;
  if (!fs::exists(layout_.trash_dir / base, ec) &&
      (layout_.trash_info_dir.empty() || !fs::exists(layout_.trash_info_dir / (base + ".trashinfo"), ec)))
    return base;

  std::time_t t = std::time(nullptr);
  std::tm tmv{};
  localtime_r(&t, &tmv);
  char stamp[32];
  std::snprintf(stamp, sizeof(stamp), "%04d%02d%02d-%02d%02d%02d",
                tmv.tm_year + 1900, tmv.tm_mon + 1, tmv.tm_mday, tmv.tm_hour, tmv.tm_min, tmv.tm_sec);
  fs::path b(base);
  std::string stem = b.stem().string();
  std::string ext = b.extension().string();
  if (stem.empty()) { stem = base; ext.clear(); }
  for (int n = 0; n < 1000; ++n) {
    std::string cand = stem + "_" + stamp + (n ? "_" + std::to_string(n) : std::string()) + ext;
    if (!fs::exists(layout_.trash_dir / cand, ec) &&
        (layout_.trash_info_dir.empty() || !fs::exists(layout_.trash_info_dir / (cand + ".trashinfo"), ec)))
      return cand;
  }
  return {};
}

// freedesktop.org layout: Trash/info/<name>.trashinfo
bool TrashBin::write_info(const std::string& name, const std::string& original, std::string& err) const {
  auto info = layout_.trash_info_dir / (name + ".trashinfo");
  std::ofstream out(info, std::ios::out | std::ios::trunc);
  if (!out) { err = "cannot write " + info.string(); return false; }
  std::time_t t = std::time(nullptr);
  std::tm tmv{};
  localtime_r(&t, &tmv);
  char when[32];
  std::strftime(when, sizeof(when), "%Y-%m-%dT%H:%M:%S", &tmv);
  out << "[Trash Info]\nPath=" << original << "\nDeletionDate=" << when << "\n";
  if (!out.good()) { err = "cannot write " + info.string(); return false; }
  return true;
}

// rename(2) that fails with EEXIST instead of replacing an existing entry
static int rename_noreplace(const char* from, const char* to) {
#ifdef __APPLE__
  return ::renamex_np(from, to, RENAME_EXCL);
#else
  int rc = ::renameat2(AT_FDCWD, from, AT_FDCWD, to, RENAME_NOREPLACE);
  if (rc != 0 && errno == EINVAL) {
    // filesystem without RENAME_NOREPLACE
    struct stat st{};
    if (::lstat(to, &st) == 0) { errno = EEXIST; return -1; }
    return ::rename(from, to);
  }
  return rc;
#endif
}

TrashResult TrashBin::move_to_trash(const std::string& path) {
  TrashResult r;
  std::error_code ec;
  fs::create_directories(layout_.trash_dir, ec);
  if (ec) { r.error = "cannot create trash: " + ec.message(); return r; }
  if (!layout_.trash_info_dir.empty()) {
    fs::create_directories(layout_.trash_info_dir, ec);
    if (ec) { r.error = "cannot create trash: " + ec.message(); return r; }
  }

  auto base = fs::path(path).filename().string();
  for (int attempt = 0; attempt < kRenameAttempts; ++attempt) {
    auto name = free_name(base);
    if (name.empty()) { r.error = "no free name in trash"; return r; }
    auto dest = (layout_.trash_dir / name).string();

    bool info_written = false;
    if (!layout_.trash_info_dir.empty()) {
      if (!write_info(name, path, r.error)) return r;
      info_written = true;
    }
#ifdef HARBOR_TESTING
    if (before_rename_) before_rename_(dest);
#endif

    if (rename_noreplace(path.c_str(), dest.c_str()) == 0) {
      r.ok = true;
      r.trashed_to = dest;
      return r;
    }
    int e = errno;
    if (info_written) fs::remove(layout_.trash_info_dir / (name + ".trashinfo"), ec);
    // name taken since free_name() looked; pick another
    if (e == EEXIST) continue;
    if (e == EXDEV) r.error = "on a different volume than the trash";
    else if (e == ENOENT) r.error = "vanished";
    else if (e == EACCES || e == EPERM) r.error = std::string("permission denied: ") + std::strerror(e);
    else r.error = std::strerror(e);
    return r;
  }
  r.error = "no free name in trash";
  return r;
}

} // namespace harbor::app
