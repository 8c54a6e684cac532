#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include "app/Alerts.hpp"
#include "app/Config.hpp"
#include "app/HealthClassifier.hpp"
#include "app/RateEstimator.hpp"
#include "app/TelemetryBuffers.hpp"
#include "app/ThermalEstimator.hpp"
#include "collectors/ICounterSource.hpp"

namespace harbor::app {

// Periodic telemetry loop on its own thread. Ticks sit on a fixed grid of
// cfg.sampling.interval_s; at most one tick is in flight, and grid slots that
// pass while a tick is still running are dropped and counted, never queued.
class Sampler {
public:
  using Callback = std::function<void(const harbor::model::TelemetryReading&)>;

  Sampler(TelemetryBuffers& buffers, std::unique_ptr<harbor::collectors::ICounterSource> source,
          EngineConfig cfg = {});
  ~Sampler();
  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  // Invoked on the sampler thread after each publish. Set before start().
  void set_callback(Callback cb) { callback_ = std::move(cb); }

  void start();
  void stop();

  // One read-estimate-classify-publish pass. Returns false without doing
  // anything if another tick is still running.
  bool tick();

  uint64_t skipped_ticks() const { return skipped_.load(); }
  uint64_t failed_ticks() const { return failed_.load(); }
  std::chrono::milliseconds interval() const { return interval_; }

#ifdef HARBOR_TESTING
  void test_set_interval(std::chrono::milliseconds iv) { interval_ = iv; }
#endif

private:
  void run(std::stop_token st);

  TelemetryBuffers& buffers_;
  std::unique_ptr<harbor::collectors::ICounterSource> source_;
  std::chrono::milliseconds interval_;
  RateEstimator estimator_;
  HealthClassifier classifier_;
  ThermalEstimator thermal_;
  AlertEngine alerts_;
  Callback callback_{};
  std::atomic<bool> in_flight_{false};
  std::atomic<uint64_t> skipped_{0};
  std::atomic<uint64_t> failed_{0};
  bool last_failed_{false};
  std::jthread thread_{};
};

} // namespace harbor::app
