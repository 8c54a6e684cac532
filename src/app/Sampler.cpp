#include "app/Sampler.hpp"

#include <algorithm>
#include <cstdio>

using namespace std::chrono;

namespace harbor::app {

Sampler::Sampler(TelemetryBuffers& buffers, std::unique_ptr<harbor::collectors::ICounterSource> source,
                 EngineConfig cfg)
  : buffers_(buffers), source_(std::move(source)),
    interval_(seconds(std::clamp(cfg.sampling.interval_s, 1, 10))),
    estimator_(RateOptions{milliseconds(cfg.sampling.min_interval_ms), cfg.sampling.smoothing_window}),
    classifier_(cfg.thresholds), thermal_(cfg.thermal), alerts_(cfg.alerts) {}

Sampler::~Sampler() { stop(); }

void Sampler::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Sampler::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

bool Sampler::tick() {
  bool expected = false;
  if (!in_flight_.compare_exchange_strong(expected, true)) {
    skipped_.fetch_add(1);
    return false;
  }
  harbor::model::Snapshot snap;
  auto& r = buffers_.back();
  if (!source_ || !source_->sample(snap)) {
    // Hold the previous rates and health; readers see the stale flag
    failed_.fetch_add(1);
    if (!last_failed_) {
      std::fprintf(stderr, "harbor: Sampler: counter read failed (%s); holding previous values\n",
                   source_ ? source_->name() : "no source");
    }
    last_failed_ = true;
    r.stale = true;
    r.wall_ms = static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
  } else {
    last_failed_ = false;
    const auto& rates = estimator_.update(snap);
    r.stale = false;
    r.warming = !estimator_.has_rates();
    r.wall_ms = snap.wall_ms;
    r.rates = rates;
    r.thermal = {};
    if (estimator_.has_rates()) {
      auto cpu = std::find_if(rates.begin(), rates.end(), [](const auto& x){ return x.kind == harbor::model::MetricKind::CpuTotal; });
      if (cpu != rates.end()) r.thermal = thermal_.estimate(cpu->value);
      r.health = classifier_.classify_all(rates, r.thermal);
      r.alerts = alerts_.evaluate(rates);
    }
  }
  r.skipped_ticks = skipped_.load();
  r.failed_ticks = failed_.load();
  buffers_.publish();
  if (callback_) callback_(r);
  in_flight_.store(false);
  return true;
}

void Sampler::run(std::stop_token st) {
  auto next_due = steady_clock::now();
  while (!st.stop_requested()) {
    auto now = steady_clock::now();
    if (now >= next_due) {
      (void)tick();
      next_due += interval_;
      // Grid slots that passed while the tick ran are dropped, not replayed
      auto after = steady_clock::now();
      while (next_due <= after) {
        next_due += interval_;
        skipped_.fetch_add(1);
      }
    }
    // sleep until next_due, bounded so stop requests are honored promptly
    auto sleep_for = duration_cast<milliseconds>(next_due - steady_clock::now());
    if (sleep_for < 20ms) sleep_for = 20ms;
    if (sleep_for > 100ms) sleep_for = 100ms;
    std::this_thread::sleep_for(sleep_for);
  }
}

} // namespace harbor::app
