// C++23 helpers for reading /proc with an optional root remap
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace harbor::util {

// Map an absolute /proc path to an alternate root if HARBOR_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Resolve a symlink (e.g. /proc/<pid>/exe, /proc/<pid>/fd/N). std::nullopt on error.
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace harbor::util
