#pragma once
#include <string>

namespace harbor::model {

enum class StartupKind { LaunchAgent, LaunchDaemon };
enum class StartupScope { User, System };

// One launchd job definition found in a LaunchAgents or LaunchDaemons folder.
struct StartupItem {
  std::string name;     // friendly name derived from the label
  std::string label;    // launchd Label, or the file name without .plist
  std::string path;     // the .plist
  std::string program;  // Program, else ProgramArguments[0]
  StartupKind kind{StartupKind::LaunchAgent};
  StartupScope scope{StartupScope::User};
  bool disabled{false}; // Disabled key in the plist
  bool loaded{false};   // launchctl knows the label

  bool enabled() const { return !disabled && loaded; }
};

const char* to_string(StartupKind k);

} // namespace harbor::model
