#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace harbor::util {

using PlistStrings = std::unordered_map<std::string, std::string>;

// Top-level scalar entries of a dictionary plist. Arrays keep only their
// string elements; nested dictionaries are skipped.
struct PlistDict {
  PlistStrings strings;
  std::unordered_map<std::string, bool> bools;
  std::unordered_map<std::string, std::vector<std::string>> string_arrays;
};

// XML or bplist00. Returns std::nullopt if the data is not a dictionary plist.
auto parse_plist(const std::vector<unsigned char>& data) -> std::optional<PlistDict>;
auto read_plist(const std::string& path) -> std::optional<PlistDict>;

// Top-level string entries only (e.g. Contents/Info.plist).
auto parse_plist_strings(const std::vector<unsigned char>& data) -> std::optional<PlistStrings>;
auto read_plist_strings(const std::string& path) -> std::optional<PlistStrings>;

} // namespace harbor::util
