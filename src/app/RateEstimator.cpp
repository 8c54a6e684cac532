#include "app/RateEstimator.hpp"

#include <algorithm>
#include <set>

namespace harbor::app {

using harbor::model::MetricKind;
using harbor::model::Rate;
using harbor::model::Unit;

RateEstimator::RateEstimator(RateOptions opts) : opts_(opts) {
  if (opts_.smoothing_window < 1) opts_.smoothing_window = 1;
}

double RateEstimator::counter_rate(uint64_t prev, uint64_t curr, double elapsed_s) {
  if (elapsed_s <= 0.0 || curr < prev) return 0.0;
  return static_cast<double>(curr - prev) / elapsed_s;
}

double RateEstimator::cpu_pct(const harbor::model::CpuTicks& prev, const harbor::model::CpuTicks& curr) {
  if (curr.total() <= prev.total() || curr.busy() < prev.busy()) return 0.0;
  double td = static_cast<double>(curr.total() - prev.total());
  double bd = static_cast<double>(curr.busy() - prev.busy());
  return std::clamp(100.0 * bd / td, 0.0, 100.0);
}

std::optional<std::vector<Rate>> RateEstimator::rates(const harbor::model::Snapshot& prev,
                                                      const harbor::model::Snapshot& curr,
                                                      std::chrono::milliseconds min_interval) {
  auto elapsed = curr.taken - prev.taken;
  if (elapsed <= std::chrono::steady_clock::duration::zero() || elapsed < min_interval) return std::nullopt;
  const double dt = std::chrono::duration<double>(elapsed).count();
  std::vector<Rate> out;

  out.push_back({MetricKind::CpuTotal, "", cpu_pct(prev.cpu.aggregate(), curr.cpu.aggregate()), Unit::Percent});
  // Core count changes (hotplug, efficiency cores parked) make per-core pairs meaningless
  if (prev.cpu.per_core.size() == curr.cpu.per_core.size()) {
    for (size_t i = 0; i < curr.cpu.per_core.size(); ++i) {
      out.push_back({MetricKind::CpuCore, std::to_string(i), cpu_pct(prev.cpu.per_core[i], curr.cpu.per_core[i]), Unit::Percent});
    }
  }

  out.push_back({MetricKind::MemoryUsed, "", curr.mem.used_pct(), Unit::Percent});
  for (const auto& v : curr.volumes) {
    out.push_back({MetricKind::VolumeUsed, v.mountpoint, v.used_pct(), Unit::Percent});
  }

  double rx_sum = 0.0, tx_sum = 0.0;
  for (const auto& c : curr.interfaces) {
    auto it = std::find_if(prev.interfaces.begin(), prev.interfaces.end(), [&](const auto& p){ return p.name == c.name; });
    if (it == prev.interfaces.end()) continue;
    double rx = counter_rate(it->rx_bytes, c.rx_bytes, dt);
    double tx = counter_rate(it->tx_bytes, c.tx_bytes, dt);
    out.push_back({MetricKind::NetRx, c.name, rx, Unit::BytesPerSec});
    out.push_back({MetricKind::NetTx, c.name, tx, Unit::BytesPerSec});
    rx_sum += rx; tx_sum += tx;
  }
  out.push_back({MetricKind::NetRx, "", rx_sum, Unit::BytesPerSec});
  out.push_back({MetricKind::NetTx, "", tx_sum, Unit::BytesPerSec});

  double rd_sum = 0.0, wr_sum = 0.0;
  for (const auto& c : curr.disks) {
    auto it = std::find_if(prev.disks.begin(), prev.disks.end(), [&](const auto& p){ return p.name == c.name; });
    if (it == prev.disks.end()) continue;
    double rd = counter_rate(it->read_bytes, c.read_bytes, dt);
    double wr = counter_rate(it->write_bytes, c.write_bytes, dt);
    out.push_back({MetricKind::DiskRead, c.name, rd, Unit::BytesPerSec});
    out.push_back({MetricKind::DiskWrite, c.name, wr, Unit::BytesPerSec});
    rd_sum += rd; wr_sum += wr;
  }
  out.push_back({MetricKind::DiskRead, "", rd_sum, Unit::BytesPerSec});
  out.push_back({MetricKind::DiskWrite, "", wr_sum, Unit::BytesPerSec});
  return out;
}

std::set<std::pair<int, std::string>> RateEstimator::reset_subjects(const harbor::model::Snapshot& prev,
                                                                    const harbor::model::Snapshot& curr) {
  std::set<std::pair<int, std::string>> out;
  auto cpu_reset = [](const harbor::model::CpuTicks& a, const harbor::model::CpuTicks& b) {
    return b.total() < a.total() || b.busy() < a.busy();
  };
  if (cpu_reset(prev.cpu.aggregate(), curr.cpu.aggregate())) out.insert({static_cast<int>(MetricKind::CpuTotal), ""});
  if (prev.cpu.per_core.size() == curr.cpu.per_core.size()) {
    for (size_t i = 0; i < curr.cpu.per_core.size(); ++i) {
      if (cpu_reset(prev.cpu.per_core[i], curr.cpu.per_core[i]))
        out.insert({static_cast<int>(MetricKind::CpuCore), std::to_string(i)});
    }
  }
  for (const auto& c : curr.interfaces) {
    auto it = std::find_if(prev.interfaces.begin(), prev.interfaces.end(), [&](const auto& p){ return p.name == c.name; });
    if (it == prev.interfaces.end()) continue;
    if (c.rx_bytes < it->rx_bytes) out.insert({static_cast<int>(MetricKind::NetRx), c.name});
    if (c.tx_bytes < it->tx_bytes) out.insert({static_cast<int>(MetricKind::NetTx), c.name});
  }
  for (const auto& c : curr.disks) {
    auto it = std::find_if(prev.disks.begin(), prev.disks.end(), [&](const auto& p){ return p.name == c.name; });
    if (it == prev.disks.end()) continue;
    if (c.read_bytes < it->read_bytes) out.insert({static_cast<int>(MetricKind::DiskRead), c.name});
    if (c.write_bytes < it->write_bytes) out.insert({static_cast<int>(MetricKind::DiskWrite), c.name});
  }
  return out;
}

double RateEstimator::smooth(const Rate& r) {
  auto& w = windows_[{static_cast<int>(r.kind), r.subject}];
  w.push_back(r.value);
  while (w.size() > static_cast<size_t>(opts_.smoothing_window)) w.pop_front();
  double sum = 0.0;
  for (double v : w) sum += v;
  return sum / static_cast<double>(w.size());
}

const std::vector<Rate>& RateEstimator::update(const harbor::model::Snapshot& curr) {
  if (!prev_) {
    prev_ = curr;
    return last_;
  }
  auto raw = rates(*prev_, curr, opts_.min_interval);
  // Too close to the previous tick (or clock went backwards): hold
  if (!raw) return last_;
  auto resets = reset_subjects(*prev_, curr);
  prev_ = curr;

  std::set<std::pair<int, std::string>> live;
  for (auto& r : *raw) {
    std::pair<int, std::string> key{static_cast<int>(r.kind), r.subject};
    live.insert(key);
    if (r.kind == MetricKind::MemoryUsed || r.kind == MetricKind::VolumeUsed) continue;
    // A reset publishes 0 and starts the subject's window over
    if (resets.count(key)) {
      r.value = 0.0;
      windows_.erase(key);
      continue;
    }
    r.value = smooth(r);
  }
  for (auto it = windows_.begin(); it != windows_.end(); ) {
    if (!live.count(it->first)) it = windows_.erase(it); else ++it;
  }
  last_ = std::move(*raw);
  have_rates_ = true;
  return last_;
}

void RateEstimator::reset() {
  prev_.reset();
  last_.clear();
  windows_.clear();
  have_rates_ = false;
}

} // namespace harbor::app
