#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "model/Metrics.hpp"
#include "model/Snapshot.hpp"

namespace harbor::app {

struct RateOptions {
  std::chrono::milliseconds min_interval{100};
  int smoothing_window{3};
};

// Turns pairs of snapshots into per-second rates and percentages.
//
// rates() is pure: the same (prev, curr) always gives the same answer. A
// counter that went backwards (interface reset, driver reload, wrap) yields 0
// for that tick, never a negative or huge value.
//
// update() owns the previous snapshot. Intervals shorter than min_interval
// are ignored and the last output is held. CPU and byte rates are smoothed
// with a moving average; memory and volume percentages come from the latest
// snapshot only. A tick on which a counter reset publishes 0 for that
// subject, unsmoothed, and the subject's window starts empty afterwards.
class RateEstimator {
public:
  explicit RateEstimator(RateOptions opts = {});

  [[nodiscard]] static std::optional<std::vector<harbor::model::Rate>> rates(
      const harbor::model::Snapshot& prev, const harbor::model::Snapshot& curr,
      std::chrono::milliseconds min_interval = std::chrono::milliseconds(100));

  // (curr - prev) / elapsed, or 0 when curr < prev
  [[nodiscard]] static double counter_rate(uint64_t prev, uint64_t curr, double elapsed_s);

  // busy/total * 100 over the delta, clamped to [0,100]; 0 on reset or no progress
  [[nodiscard]] static double cpu_pct(const harbor::model::CpuTicks& prev, const harbor::model::CpuTicks& curr);

  const std::vector<harbor::model::Rate>& update(const harbor::model::Snapshot& curr);

  bool has_rates() const { return have_rates_; }
  const std::vector<harbor::model::Rate>& last() const { return last_; }
  void reset();

  // (kind, subject) pairs whose counters went backwards between prev and curr
  static std::set<std::pair<int, std::string>> reset_subjects(const harbor::model::Snapshot& prev,
                                                              const harbor::model::Snapshot& curr);

private:
  double smooth(const harbor::model::Rate& r);

  RateOptions opts_;
  std::optional<harbor::model::Snapshot> prev_;
  std::vector<harbor::model::Rate> last_;
  bool have_rates_{false};
  std::map<std::pair<int, std::string>, std::deque<double>> windows_;
};

} // namespace harbor::app
