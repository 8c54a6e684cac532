#pragma once

namespace harbor::model {

// CPU temperature approximated from load. No sensor is ever read, so the
// value is always flagged as an estimate and must be shown that way.
struct ThermalEstimate {
  double celsius{0.0};
  double source_load_pct{0.0};
  bool is_estimate{true};
  bool has_value{false};
};

} // namespace harbor::model
