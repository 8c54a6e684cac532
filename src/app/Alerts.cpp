#include "app/Alerts.hpp"
#include <cstdio>

namespace harbor::app {

using harbor::model::MetricKind;

AlertEngine::AlertEngine(AlertRules rules) : rules_(rules) {}

bool AlertEngine::cooled(std::chrono::steady_clock::time_point last, std::chrono::steady_clock::time_point now,
                         std::chrono::seconds cooldown) {
  return last.time_since_epoch().count() == 0 || now - last >= cooldown;
}

std::vector<harbor::model::AlertItem> AlertEngine::evaluate(const std::vector<harbor::model::Rate>& rates,
                                                            std::chrono::steady_clock::time_point now) {
  std::vector<harbor::model::AlertItem> out;
  double cpu = -1.0, mem = -1.0, vol = -1.0;
  std::string vol_name;
  for (const auto& r : rates) {
    if (r.kind == MetricKind::CpuTotal) cpu = r.value;
    else if (r.kind == MetricKind::MemoryUsed) mem = r.value;
    else if (r.kind == MetricKind::VolumeUsed && r.value > vol) { vol = r.value; vol_name = r.subject; }
  }

  // CPU total sustained
  if (cpu >= rules_.cpu_high_pct) {
    if (cpu_high_since_.time_since_epoch().count() == 0) cpu_high_since_ = now;
    if (now - cpu_high_since_ >= rules_.cpu_sustain && cooled(last_cpu_alert_, now, rules_.cpu_cooldown)) {
      char msg[96];
      std::snprintf(msg, sizeof(msg), "CPU above %.0f%% for %llds", rules_.cpu_high_pct,
                    static_cast<long long>(rules_.cpu_sustain.count()));
      out.push_back({"crit", msg});
      last_cpu_alert_ = now;
      cpu_high_since_ = {};
    }
  } else { cpu_high_since_ = {}; }

  // Memory
  if (mem >= rules_.mem_high_pct && cooled(last_mem_alert_, now, rules_.mem_cooldown)) {
    char msg[96];
    std::snprintf(msg, sizeof(msg), "Memory usage at %.0f%%", mem);
    out.push_back({"crit", msg});
    last_mem_alert_ = now;
  }

  // Fullest volume
  if (vol >= rules_.volume_high_pct && cooled(last_volume_alert_, now, rules_.volume_cooldown)) {
    out.push_back({"warn", "Volume " + vol_name + " is " + std::to_string(static_cast<int>(vol)) + "% full"});
    last_volume_alert_ = now;
  }
  return out;
}

} // namespace harbor::app
