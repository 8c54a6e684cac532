#pragma once
#include <string>
#include <utility>
#include <vector>

namespace harbor::app {

// The few launchctl verbs the startup item list needs.
class ILaunchControl {
public:
  virtual ~ILaunchControl() = default;

  // launchd has a job with this label
  [[nodiscard]] virtual bool loaded(const std::string& label) = 0;
  [[nodiscard]] virtual bool load(const std::string& plist_path) = 0;
  [[nodiscard]] virtual bool unload(const std::string& plist_path) = 0;
};

// Runs /bin/launchctl directly (no shell) and reports its exit status.
// Where launchctl does not exist every call answers false.
class LaunchctlControl : public ILaunchControl {
public:
  explicit LaunchctlControl(std::string binary = "/bin/launchctl") : binary_(std::move(binary)) {}

  [[nodiscard]] bool loaded(const std::string& label) override { return run({"list", label}); }
  [[nodiscard]] bool load(const std::string& plist_path) override { return run({"load", plist_path}); }
  [[nodiscard]] bool unload(const std::string& plist_path) override { return run({"unload", plist_path}); }

private:
  bool run(const std::vector<std::string>& args) const;

  std::string binary_;
};

} // namespace harbor::app
