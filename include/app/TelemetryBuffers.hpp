#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>
#include "app/HistoryRing.hpp"
#include "model/Metrics.hpp"

namespace harbor::app {

// Latest-reading buffer between the sampler thread and readers. The sampler
// fills back() and publishes; readers take copies.
class TelemetryBuffers {
public:
  explicit TelemetryBuffers(size_t history_capacity = 120);
  // Non-copyable
  TelemetryBuffers(const TelemetryBuffers&) = delete;
  TelemetryBuffers& operator=(const TelemetryBuffers&) = delete;

  harbor::model::TelemetryReading& back(); // sampler thread only
  void publish();                          // stamp seq, expose, append to history

  harbor::model::TelemetryReading latest() const;
  std::vector<harbor::model::TelemetryReading> history() const;
  uint64_t seq() const { return seq_.load(std::memory_order_acquire); }

private:
  harbor::model::TelemetryReading back_{};
  harbor::model::TelemetryReading front_{};
  HistoryRing<harbor::model::TelemetryReading> history_;
  mutable std::mutex mu_;
  std::atomic<uint64_t> seq_{0};
};

} // namespace harbor::app
