#include "minitest.hpp"
#include "app/Sampler.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

// Counter source whose counters advance by a fixed step per read.
class StepSource : public harbor::collectors::ICounterSource {
public:
  std::atomic<bool> fail{false};
  std::atomic<int> reads{0};
  std::atomic<bool> block{false};
  std::mutex mu;
  std::condition_variable cv;
  bool released{false};

  bool sample(harbor::model::Snapshot& out) override {
    ++reads;
    if (block.load()) {
      std::unique_lock<std::mutex> lk(mu);
      cv.wait(lk, [&]{ return released; });
    }
    if (fail.load()) return false;
    int n = reads.load();
    out.taken = std::chrono::steady_clock::time_point{} + 1h + std::chrono::seconds(n);
    out.cpu.per_core = {{static_cast<uint64_t>(n) * 50, 0, 0, static_cast<uint64_t>(n) * 50}};
    out.mem.total_bytes = 100;
    out.mem.active_bytes = 40;
    out.interfaces = {{"en0", static_cast<uint64_t>(n) * 1000, 0}};
    return true;
  }
  const char* name() const override { return "step"; }

  void release() {
    std::lock_guard<std::mutex> lk(mu);
    released = true;
    cv.notify_all();
  }
};

TEST(sampler_first_tick_is_warming) {
  harbor::app::TelemetryBuffers buffers;
  auto src = std::make_unique<StepSource>();
  harbor::app::Sampler sampler(buffers, std::move(src));
  ASSERT_TRUE(sampler.tick());
  auto r = buffers.latest();
  ASSERT_EQ(r.seq, 1u);
  ASSERT_TRUE(r.warming);
  ASSERT_TRUE(!r.stale);
  ASSERT_TRUE(sampler.tick());
  r = buffers.latest();
  ASSERT_TRUE(!r.warming);
  ASSERT_TRUE(!r.rates.empty());
  ASSERT_TRUE(r.thermal.has_value);
  ASSERT_TRUE(r.thermal.is_estimate);
  ASSERT_TRUE(!r.health.empty());
}

TEST(sampler_failure_marks_stale_and_holds) {
  harbor::app::TelemetryBuffers buffers;
  auto src = std::make_unique<StepSource>();
  auto* raw = src.get();
  harbor::app::Sampler sampler(buffers, std::move(src));
  sampler.tick();
  sampler.tick();
  auto good = buffers.latest();
  raw->fail = true;
  sampler.tick();
  auto bad = buffers.latest();
  ASSERT_TRUE(bad.stale);
  ASSERT_EQ(bad.rates.size(), good.rates.size());
  ASSERT_EQ(sampler.failed_ticks(), 1u);
  raw->fail = false;
  sampler.tick();
  ASSERT_TRUE(!buffers.latest().stale);
}

TEST(sampler_single_tick_in_flight) {
  harbor::app::TelemetryBuffers buffers;
  auto src = std::make_unique<StepSource>();
  auto* raw = src.get();
  raw->block = true;
  harbor::app::Sampler sampler(buffers, std::move(src));
  std::thread first([&]{ sampler.tick(); });
  while (raw->reads.load() == 0) std::this_thread::sleep_for(1ms);
  ASSERT_TRUE(!sampler.tick());
  ASSERT_EQ(sampler.skipped_ticks(), 1u);
  raw->release();
  first.join();
  ASSERT_EQ(buffers.seq(), 1u);
}

TEST(sampler_thread_publishes_with_callback) {
  harbor::app::TelemetryBuffers buffers;
  harbor::app::Sampler sampler(buffers, std::make_unique<StepSource>());
  sampler.test_set_interval(30ms);
  std::atomic<int> calls{0};
  sampler.set_callback([&](const harbor::model::TelemetryReading&) { ++calls; });
  sampler.start();
  auto t0 = std::chrono::steady_clock::now();
  while (calls.load() < 3 && std::chrono::steady_clock::now() - t0 < 3s) std::this_thread::sleep_for(5ms);
  sampler.stop();
  ASSERT_TRUE(calls.load() >= 3);
  ASSERT_TRUE(buffers.seq() >= 3u);
  ASSERT_EQ(buffers.latest().seq, buffers.seq());
}

TEST(sampler_interval_is_clamped) {
  harbor::app::TelemetryBuffers buffers;
  harbor::app::EngineConfig cfg;
  cfg.sampling.interval_s = 60;
  harbor::app::Sampler slow(buffers, std::make_unique<StepSource>(), cfg);
  ASSERT_EQ(slow.interval(), std::chrono::milliseconds(10000));
  cfg.sampling.interval_s = 0;
  harbor::app::Sampler fast(buffers, std::make_unique<StepSource>(), cfg);
  ASSERT_EQ(fast.interval(), std::chrono::milliseconds(1000));
}
