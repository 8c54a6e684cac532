#include "app/HealthClassifier.hpp"

namespace harbor::app {

using harbor::model::HealthLevel;
using harbor::model::MetricKind;

HealthLevel classify(double value, const harbor::model::Threshold& t) {
  if (value >= t.critical_at) return HealthLevel::Critical;
  if (value >= t.elevated_at) return HealthLevel::Elevated;
  return HealthLevel::Nominal;
}

std::optional<harbor::model::Threshold> threshold_for(MetricKind kind, const ThresholdConfig& cfg) {
  switch (kind) {
    case MetricKind::CpuTotal:
    case MetricKind::CpuCore:     return cfg.cpu;
    case MetricKind::MemoryUsed:  return cfg.memory;
    case MetricKind::VolumeUsed:  return cfg.volume;
    case MetricKind::Temperature: return cfg.temperature;
    default:                      return std::nullopt;
  }
}

HealthLevel classify(MetricKind kind, double value, const ThresholdConfig& cfg) {
  auto t = threshold_for(kind, cfg);
  return t ? classify(value, *t) : HealthLevel::Nominal;
}

HealthClassifier::HealthClassifier(ThresholdConfig cfg) : cfg_(cfg) {}

HealthLevel HealthClassifier::classify(MetricKind kind, const std::string& subject, double value) {
  auto t = threshold_for(kind, cfg_);
  if (!t) return HealthLevel::Nominal;
  HealthLevel raw = harbor::app::classify(value, *t);
  auto key = std::make_pair(static_cast<int>(kind), subject);
  auto it = last_.find(key);
  if (it == last_.end() || raw >= it->second) {
    last_[key] = raw;
    return raw;
  }
  // Downgrade: shifting the value up by the margin keeps the old level until
  // the value is strictly below (threshold - margin). Never above the old level.
  HealthLevel held = harbor::app::classify(value + cfg_.hysteresis, *t);
  if (held > it->second) held = it->second;
  it->second = held;
  return held;
}

std::vector<harbor::model::ClassifiedMetric> HealthClassifier::classify_all(
    const std::vector<harbor::model::Rate>& rates, const harbor::model::ThermalEstimate& thermal) {
  std::vector<harbor::model::ClassifiedMetric> out;
  for (const auto& r : rates) {
    // Per-core levels flap too much to be useful; the aggregate carries CPU health
    if (r.kind == MetricKind::CpuCore) continue;
    auto t = threshold_for(r.kind, cfg_);
    if (!t) continue;
    out.push_back({r.kind, r.subject, r.value, classify(r.kind, r.subject, r.value), *t});
  }
  if (thermal.has_value) {
    out.push_back({MetricKind::Temperature, "", thermal.celsius,
                   classify(MetricKind::Temperature, "", thermal.celsius), cfg_.temperature});
  }
  return out;
}

std::optional<HealthLevel> HealthClassifier::last(MetricKind kind, const std::string& subject) const {
  auto it = last_.find({static_cast<int>(kind), subject});
  if (it == last_.end()) return std::nullopt;
  return it->second;
}

} // namespace harbor::app
