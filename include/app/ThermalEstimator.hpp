#pragma once
#include "app/Config.hpp"
#include "model/Thermal.hpp"

namespace harbor::app {

// Linear load-to-temperature estimate: idle_c at 0% load, max_c at 100%.
// Unprivileged processes cannot read the SMC sensors, so this never pretends
// to be a measurement.
class ThermalEstimator {
public:
  explicit ThermalEstimator(ThermalConfig cfg = {}) : cfg_(cfg) {}
  [[nodiscard]] harbor::model::ThermalEstimate estimate(double cpu_load_pct) const;
private:
  ThermalConfig cfg_;
};

} // namespace harbor::app
