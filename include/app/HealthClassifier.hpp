#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "app/Config.hpp"
#include "model/Metrics.hpp"

namespace harbor::app {

// Pure tri-state classification: >= critical_at is Critical, >= elevated_at
// is Elevated, anything lower is Nominal. Monotonic in value.
[[nodiscard]] harbor::model::HealthLevel classify(double value, const harbor::model::Threshold& t);

// Thresholds configured for a metric kind; rates without one (network, disk
// I/O) are informational and always Nominal.
[[nodiscard]] std::optional<harbor::model::Threshold> threshold_for(harbor::model::MetricKind kind, const ThresholdConfig& cfg);

[[nodiscard]] harbor::model::HealthLevel classify(harbor::model::MetricKind kind, double value, const ThresholdConfig& cfg);

// Stateful wrapper that remembers only the last level per (metric, subject).
// Upgrades are immediate; a downgrade needs the value to drop below the
// crossed threshold by cfg.hysteresis points.
class HealthClassifier {
public:
  explicit HealthClassifier(ThresholdConfig cfg = {});

  harbor::model::HealthLevel classify(harbor::model::MetricKind kind, const std::string& subject, double value);

  // Classify every rate that has thresholds, plus the thermal estimate.
  std::vector<harbor::model::ClassifiedMetric> classify_all(const std::vector<harbor::model::Rate>& rates,
                                                            const harbor::model::ThermalEstimate& thermal);

  std::optional<harbor::model::HealthLevel> last(harbor::model::MetricKind kind, const std::string& subject) const;
  const ThresholdConfig& thresholds() const { return cfg_; }

private:
  ThresholdConfig cfg_;
  std::map<std::pair<int, std::string>, harbor::model::HealthLevel> last_;
};

} // namespace harbor::app
