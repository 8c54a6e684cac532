#include "app/CacheRoots.hpp"

#include <algorithm>
#include <array>
#include <cctype>

using harbor::model::Category;

namespace harbor::app {

const char* to_string(ScanKind k) {
  switch (k) {
    case ScanKind::Caches: return "caches";
    case ScanKind::Browser: return "browser";
    case ScanKind::AppCaches: return "app-caches";
    case ScanKind::Developer: return "developer";
    case ScanKind::Logs: return "logs";
    case ScanKind::Tmp: return "tmp";
    case ScanKind::Installers: return "installers";
    case ScanKind::Leftovers: return "leftovers";
  }
  return "unknown";
}

std::optional<ScanKind> parse_scan_kind(std::string_view s) {
  static constexpr std::array<ScanKind, 8> all = {
    ScanKind::Caches, ScanKind::Browser, ScanKind::AppCaches, ScanKind::Developer,
    ScanKind::Logs, ScanKind::Tmp, ScanKind::Installers, ScanKind::Leftovers,
  };
  for (auto k : all) if (s == to_string(k)) return k;
  return std::nullopt;
}

const std::vector<CacheRoot>& cache_roots() {
  static const std::vector<CacheRoot> table = {
    // Browsers
    {"safari", "Safari cache", ScanKind::Browser, RootBase::Home, "Library/Caches/com.apple.Safari/WebKitCache",
     Category::BrowserCache, RootMode::Self, "com.apple.Safari"},
    {"chrome", "Chrome cache", ScanKind::Browser, RootBase::Home, "Library/Caches/Google/Chrome",
     Category::BrowserCache, RootMode::Children, "com.google.Chrome"},
    {"chrome-id", "Chrome cache", ScanKind::Browser, RootBase::Home, "Library/Caches/com.google.Chrome",
     Category::BrowserCache, RootMode::Children, "com.google.Chrome"},
    {"chrome-default", "Chrome disk cache", ScanKind::Browser, RootBase::Home,
     "Library/Application Support/Google/Chrome/Default/Cache", Category::BrowserCache, RootMode::Self, "com.google.Chrome"},
    {"chrome-code", "Chrome code cache", ScanKind::Browser, RootBase::Home,
     "Library/Application Support/Google/Chrome/Default/Code Cache", Category::BrowserCache, RootMode::Self, "com.google.Chrome"},
    {"chrome-gpu", "Chrome GPU cache", ScanKind::Browser, RootBase::Home,
     "Library/Application Support/Google/Chrome/Default/GPUCache", Category::BrowserCache, RootMode::Self, "com.google.Chrome"},
    {"firefox", "Firefox cache", ScanKind::Browser, RootBase::Home, "Library/Caches/Firefox",
     Category::BrowserCache, RootMode::Children, "org.mozilla.firefox"},
    {"firefox-id", "Firefox cache", ScanKind::Browser, RootBase::Home, "Library/Caches/org.mozilla.firefox",
     Category::BrowserCache, RootMode::Children, "org.mozilla.firefox"},
    {"brave", "Brave cache", ScanKind::Browser, RootBase::Home, "Library/Caches/BraveSoftware/Brave-Browser",
     Category::BrowserCache, RootMode::Children, "com.brave.Browser"},
    {"brave-id", "Brave cache", ScanKind::Browser, RootBase::Home, "Library/Caches/com.brave.Browser",
     Category::BrowserCache, RootMode::Children, "com.brave.Browser"},
    {"edge", "Edge cache", ScanKind::Browser, RootBase::Home, "Library/Caches/Microsoft Edge",
     Category::BrowserCache, RootMode::Children, "com.microsoft.edgemac"},
    {"edge-id", "Edge cache", ScanKind::Browser, RootBase::Home, "Library/Caches/com.microsoft.edgemac",
     Category::BrowserCache, RootMode::Children, "com.microsoft.edgemac"},
    {"opera", "Opera cache", ScanKind::Browser, RootBase::Home, "Library/Caches/com.operasoftware.Opera",
     Category::BrowserCache, RootMode::Children, "com.operasoftware.Opera"},

    // Developer tools
    {"xcode-derived", "Xcode DerivedData", ScanKind::Developer, RootBase::Home, "Library/Developer/Xcode/DerivedData",
     Category::AppCache, RootMode::Children, "com.apple.dt.Xcode"},
    {"simulator-caches", "Simulator caches", ScanKind::Developer, RootBase::Home, "Library/Developer/CoreSimulator/Caches",
     Category::AppCache, RootMode::Children, "com.apple.CoreSimulator.SimulatorTrampoline"},

    // General application caches
    {"user-caches", "Application caches", ScanKind::AppCaches, RootBase::Home, "Library/Caches",
     Category::AppCache, RootMode::Children, "", AgeRule::None, {}, true},
    {"app-support-caches", "Application Support caches", ScanKind::AppCaches, RootBase::Home, "Library/Application Support",
     Category::AppCache, RootMode::ChildCaches, "", AgeRule::None, {}, true},

    // Logs and temporary files
    {"user-logs", "User logs", ScanKind::Logs, RootBase::Home, "Library/Logs",
     Category::SystemLog, RootMode::Children, "", AgeRule::Logs},
    {"tmp", "Temporary files", ScanKind::Tmp, RootBase::Temp, "",
     Category::Tmp, RootMode::Children, ""},

    // Downloaded installers
    {"installers", "Old installers", ScanKind::Installers, RootBase::Home, "Downloads",
     Category::Installer, RootMode::Children, "", AgeRule::Installers, {".dmg", ".pkg", ".iso"}},
  };
  return table;
}

bool root_in_scan(const CacheRoot& r, ScanKind k) {
  if (r.group == k) return true;
  if (k != ScanKind::Caches) return false;
  switch (r.group) {
    case ScanKind::Browser:
    case ScanKind::AppCaches:
    case ScanKind::Developer:
    case ScanKind::Logs:
    case ScanKind::Tmp:
      return true;
    default:
      return false;
  }
}

static constexpr std::array<std::string_view, 41> kProtectedAppSupport = {
  "addressbook", "dock", "icloud", "clouddocs", "mobilesync", "knowledge", "callhistorydb",
  "syncservices", "google", "firefox", "sublime text", "code", "jetbrains", "microsoft",
  "adobe", "spotify", "discord", "slack", "zoom", "telegram", "steam", "epic", "1password",
  "bitwarden", "keychain", "crashreporter", "coresimulator", "developer", "obs-studio",
  "notion", "bear", "obsidian", "evernote", "dropbox", "onedrive", "virtualbox", "vmware",
  "parallels", "docker", "atom", "visual studio code",
};

bool is_protected_app_support(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return std::find(kProtectedAppSupport.begin(), kProtectedAppSupport.end(), lower) != kProtectedAppSupport.end();
}

} // namespace harbor::app
