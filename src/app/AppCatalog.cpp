#include "app/AppCatalog.hpp"
#include "util/Plist.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>

namespace fs = std::filesystem;

using harbor::model::AppRecord;

namespace harbor::app {

static constexpr std::array<std::string_view, 62> kSystemAppNames = {
  "Safari", "Mail", "App Store", "System Preferences", "System Settings", "Finder", "Terminal",
  "Utilities", "Activity Monitor", "Console", "Disk Utility", "Font Book", "Keychain Access",
  "Migration Assistant", "Screenshot", "Preview", "TextEdit", "Time Machine", "Siri", "FaceTime",
  "Messages", "Calendar", "Contacts", "Reminders", "Notes", "Books", "News", "Stocks", "Home",
  "Voice Memos", "Photos", "Music", "Podcasts", "TV", "Maps", "Weather", "Clock", "Calculator",
  "Dictionary", "Archive Utility", "Bluetooth File Exchange", "Boot Camp Assistant",
  "ColorSync Utility", "Digital Color Meter", "Directory Utility", "Grapher", "MIDI Audio Setup",
  "Script Editor", "System Information", "VoiceOver Utility", "Automator", "Image Capture",
  "Launchpad", "Mission Control", "Stickies", "Chess", "DVD Player", "Photo Booth",
  "QuickTime Player", "AirPort Utility", "Audio MIDI Setup", "Shortcuts",
};

static std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

bool AppCatalog::is_system_app(std::string_view name, std::string_view bundle_id) {
  if (bundle_id.rfind("com.apple.", 0) == 0) return true;
  return std::find(kSystemAppNames.begin(), kSystemAppNames.end(), name) != kSystemAppNames.end();
}

std::vector<fs::path> AppCatalog::bundles() const {
  std::vector<fs::path> out;
  for (const auto& root : policy_.layout().app_roots) {
    std::error_code ec;
    fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) continue;  // a missing ~/Applications is normal
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
      if (ec) {
        std::fprintf(stderr, "harbor: AppCatalog: listing %s stopped: %s\n", root.c_str(), ec.message().c_str());
        break;
      }
      const auto& p = it->path();
      if (p.extension() != ".app") continue;
      auto st = it->symlink_status(ec);
      if (ec || !fs::is_directory(st)) { ec.clear(); continue; }
      out.push_back(p);
    }
  }
  return out;
}

InstalledIndex AppCatalog::installed() const {
  InstalledIndex idx;
  for (const auto& b : bundles()) {
    idx.names.insert(lower(b.stem().string()));
    auto info = harbor::util::read_plist_strings((b / "Contents/Info.plist").string());
    if (!info) continue;
    auto it = info->find("CFBundleIdentifier");
    if (it == info->end() || it->second.empty()) continue;
    auto id = lower(it->second);
    idx.bundle_ids.insert(id);
    auto dot = id.rfind('.');
    idx.names.insert(dot == std::string::npos ? id : id.substr(dot + 1));
  }
  return idx;
}

std::vector<AppRecord> AppCatalog::list_apps(const LiveState& live, bool with_sizes) const {
  std::vector<AppRecord> apps;
  for (const auto& b : bundles()) {
    auto info = harbor::util::read_plist_strings((b / "Contents/Info.plist").string());
    if (!info) {
      std::fprintf(stderr, "harbor: AppCatalog: unreadable Info.plist in %s\n", b.c_str());
      continue;
    }
    auto get = [&](const char* key) -> std::string {
      auto it = info->find(key);
      return it == info->end() ? std::string() : it->second;
    };
    AppRecord r;
    r.bundle_id = get("CFBundleIdentifier");
    if (r.bundle_id.empty()) continue;
    r.display_name = get("CFBundleDisplayName");
    if (r.display_name.empty()) r.display_name = get("CFBundleName");
    if (r.display_name.empty()) r.display_name = b.stem().string();
    if (is_system_app(b.stem().string(), r.bundle_id) || is_system_app(r.display_name, r.bundle_id)) continue;
    if (lower(r.bundle_id) == lower(policy_.layout().self_bundle_id)) continue;
    r.install_path = b.string();
    r.version = get("CFBundleShortVersionString");
    r.is_running = live.exe_under(r.install_path);
    if (with_sizes) r.bundle_bytes = policy_.size_of(r.install_path);
    apps.push_back(std::move(r));
  }
  std::sort(apps.begin(), apps.end(), [](const AppRecord& a, const AppRecord& b) {
    return lower(a.display_name) < lower(b.display_name);
  });
  return apps;
}

std::optional<AppRecord> AppCatalog::find(std::string_view bundle_id, const LiveState& live) const {
  auto want = lower(bundle_id);
  for (auto& app : list_apps(live, true)) {
    if (lower(app.bundle_id) == want) return std::move(app);
  }
  return std::nullopt;
}

} // namespace harbor::app
