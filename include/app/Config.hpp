#pragma once

#include <string>
#include "app/Alerts.hpp"
#include "model/Metrics.hpp"

namespace harbor::app {

struct SamplingConfig {
  int interval_s{2};          // clamped to 1..10
  int min_interval_ms{100};   // ticks closer than this hold the previous rates
  int smoothing_window{3};    // moving-average length
  int history_capacity{120};  // readings kept for charting
};

struct ThresholdConfig {
  harbor::model::Threshold cpu{70.0, 90.0};
  harbor::model::Threshold memory{75.0, 90.0};
  harbor::model::Threshold volume{80.0, 90.0};
  harbor::model::Threshold temperature{70.0, 85.0};
  double hysteresis{2.0};
};

struct ThermalConfig {
  double idle_c{45.0};
  double max_c{95.0};
};

struct CleanupConfig {
  int max_depth{16};
  int log_age_days{7};
  int installer_age_days{30};
  std::string journal_dir;
};

struct EngineConfig {
  SamplingConfig sampling;
  ThresholdConfig thresholds;
  AlertRules alerts;
  ThermalConfig thermal;
  CleanupConfig cleanup;
};

// Environment variable helpers (HARBOR_FOO also answers to harbor_foo)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// $XDG_CONFIG_HOME/harbor/config.toml or ~/.config/harbor/config.toml
std::string config_file_path();
std::string default_journal_dir();

// Resolve every setting TOML -> env -> compiled default, then clamp.
EngineConfig load_engine_config();
EngineConfig load_engine_config(const std::string& toml_path);

} // namespace harbor::app
