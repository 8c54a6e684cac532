#pragma once
#include <set>
#include <string>
#include <vector>
#include "collectors/IProcessSource.hpp"

namespace harbor::app {

// Which files are open and which apps are running, captured once per scan or
// execution and consulted for every entry.
struct LiveState {
  std::vector<std::string> open_paths;    // sorted
  std::vector<std::string> running_exes;  // sorted
  std::set<std::string> running_bundle_ids;

  // An open file is p itself or lies beneath it
  bool open_at_or_under(const std::string& p) const;
  // A running executable lies beneath p (p is usually an .app bundle)
  bool exe_under(const std::string& p) const;
  // name is a running bundle id or one of its children (com.foo.App.helper)
  bool bundle_running(const std::string& name) const;
  // Some running executable lives in "<name>.app"
  bool app_name_running(const std::string& name) const;

  static LiveState capture(harbor::collectors::IProcessSource& src);
  void normalize();
};

} // namespace harbor::app
