#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/Cleanup.hpp"

namespace harbor::app {

// Bumped whenever a row is added, removed or changes meaning.
inline constexpr int kCacheTableVersion = 3;

enum class ScanKind { Caches, Browser, AppCaches, Developer, Logs, Tmp, Installers, Leftovers };

const char* to_string(ScanKind k);
std::optional<ScanKind> parse_scan_kind(std::string_view s);

enum class RootBase { Home, Temp };

enum class RootMode {
  Children,     // each direct child of the root is a candidate
  Self,         // the root itself is the candidate
  ChildCaches,  // <child>/Cache and <child>/Caches of each direct child
};

enum class AgeRule { None, Logs, Installers };

struct CacheRoot {
  std::string id;
  std::string label;
  ScanKind group;
  RootBase base;
  std::string rel;               // relative to home; ignored for Temp
  harbor::model::Category category;
  RootMode mode;
  std::string owner_bundle_id;   // app whose running instance makes the root in use
  AgeRule age{AgeRule::None};
  std::vector<std::string> extensions;  // lowercase, with the dot; empty = any
  bool skip_system_names{false};        // drop com.apple.* and system-app names
};

const std::vector<CacheRoot>& cache_roots();

// Does a row belong to a scan of kind k? Caches covers every cache-like group.
bool root_in_scan(const CacheRoot& r, ScanKind k);

// Application Support folders that must never be offered (lowercase names).
bool is_protected_app_support(std::string_view name);

} // namespace harbor::app
