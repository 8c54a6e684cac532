#include "app/ThermalEstimator.hpp"
#include <algorithm>

namespace harbor::app {

harbor::model::ThermalEstimate ThermalEstimator::estimate(double cpu_load_pct) const {
  harbor::model::ThermalEstimate t;
  double load = std::clamp(cpu_load_pct, 0.0, 100.0);
  t.source_load_pct = load;
  t.celsius = cfg_.idle_c + (load / 100.0) * (cfg_.max_c - cfg_.idle_c);
  t.is_estimate = true;
  t.has_value = true;
  return t;
}

} // namespace harbor::app
