#include "app/TelemetryBuffers.hpp"

namespace harbor::app {

TelemetryBuffers::TelemetryBuffers(size_t history_capacity) : history_(history_capacity) {}

harbor::model::TelemetryReading& TelemetryBuffers::back() { return back_; }

void TelemetryBuffers::publish() {
  std::lock_guard<std::mutex> lk(mu_);
  back_.seq = seq_.load(std::memory_order_relaxed) + 1;
  front_ = back_;
  history_.push(back_);
  seq_.store(back_.seq, std::memory_order_release);
}

harbor::model::TelemetryReading TelemetryBuffers::latest() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

std::vector<harbor::model::TelemetryReading> TelemetryBuffers::history() const {
  std::lock_guard<std::mutex> lk(mu_);
  return history_.items();
}

} // namespace harbor::app
