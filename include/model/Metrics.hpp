#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "model/Thermal.hpp"

namespace harbor::model {

enum class MetricKind { CpuTotal, CpuCore, MemoryUsed, VolumeUsed, NetRx, NetTx, DiskRead, DiskWrite, Temperature };
enum class Unit { Percent, BytesPerSec, Celsius };
enum class HealthLevel { Nominal = 0, Elevated = 1, Critical = 2 };

// Per-second value derived from two snapshots. Only meaningful together with
// the interval it was computed over; never persisted.
struct Rate {
  MetricKind kind{MetricKind::CpuTotal};
  std::string subject; // core index, interface, device or mountpoint; empty for aggregates
  double value{};
  Unit unit{Unit::Percent};
};

struct Threshold {
  double elevated_at{};
  double critical_at{};
};

struct ClassifiedMetric {
  MetricKind kind{MetricKind::CpuTotal};
  std::string subject;
  double value{};
  HealthLevel level{HealthLevel::Nominal};
  Threshold threshold{};
};

struct AlertItem {
  std::string severity; // warn|crit
  std::string message;
};

// What the sampler publishes each tick.
struct TelemetryReading {
  uint64_t seq{};
  uint64_t wall_ms{};
  bool stale{false};          // counter read failed; values held from the last good tick
  bool warming{true};         // no rate pair yet
  uint64_t skipped_ticks{};   // due ticks dropped because one was still in flight
  uint64_t failed_ticks{};
  std::vector<Rate> rates;
  std::vector<ClassifiedMetric> health;
  ThermalEstimate thermal;
  std::vector<AlertItem> alerts;
};

const char* to_string(MetricKind k);
const char* to_string(Unit u);
const char* to_string(HealthLevel l);

} // namespace harbor::model
