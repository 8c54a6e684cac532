#pragma once
#include "model/Metrics.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace harbor::app {

struct AlertRules {
  double cpu_high_pct    = 95.0;   // crit if sustained
  double mem_high_pct    = 90.0;
  double volume_high_pct = 90.0;   // any volume
  std::chrono::seconds cpu_sustain     = std::chrono::seconds(30);
  std::chrono::seconds cpu_cooldown    = std::chrono::seconds(60);
  std::chrono::seconds mem_cooldown    = std::chrono::seconds(300);
  std::chrono::seconds volume_cooldown = std::chrono::seconds(3600);
};

// Turns rates into alert records. Delivery (notifications) is the caller's
// concern; each metric stays quiet for its cooldown after it fires.
class AlertEngine {
public:
  explicit AlertEngine(AlertRules rules = {});
  // May return empty if healthy
  std::vector<harbor::model::AlertItem> evaluate(const std::vector<harbor::model::Rate>& rates,
                                                 std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
private:
  static bool cooled(std::chrono::steady_clock::time_point last, std::chrono::steady_clock::time_point now,
                     std::chrono::seconds cooldown);
  AlertRules rules_;
  std::chrono::steady_clock::time_point cpu_high_since_{};
  std::chrono::steady_clock::time_point last_cpu_alert_{};
  std::chrono::steady_clock::time_point last_mem_alert_{};
  std::chrono::steady_clock::time_point last_volume_alert_{};
};

} // namespace harbor::app
