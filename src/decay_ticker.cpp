// ============================================================================
// decay_ticker.cpp -- implementation of the DecayTicker class
// ============================================================================
#include "genpool/decay_ticker.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace genpool {

// ============================================================================
// Impl: implementation of the DecayTicker class
// ============================================================================
struct DecayTicker::Impl {
  Impl(Registry& registry_, DecayTickerConfig cfg_)
   : registry(registry_), cfg(cfg_) {}

  Registry&          registry;
  DecayTickerConfig  cfg;

  /// Thread for the ticker loop
  std::thread        th;
  std::atomic<bool>  run{false};

  /// stop() wakes the loop early instead of waiting out the interval
  std::mutex              mtx;
  std::condition_variable cv;

  Stats stats;

  void loop() {
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::milliseconds(cfg.interval_ms);
    auto next = clock::now() + period;

    while (run.load(std::memory_order_relaxed)) {
      {
        std::unique_lock lk(mtx);
        cv.wait_until(lk, next, [&]{
          return !run.load(std::memory_order_relaxed);
        });
      }
      if (!run.load(std::memory_order_relaxed)) break;

      registry.decay();
      const uint64_t n = stats.ticks.fetch_add(1, std::memory_order_relaxed) + 1;
      if (cfg.verbose) {
        std::printf("DECAY: step %llu (victim pools=%zu)\n",
                    (unsigned long long)n, registry.victim_pools());
      }
      next += period;
    }
  }
};

DecayTicker::DecayTicker(Registry& registry, DecayTickerConfig cfg)
: impl_(std::make_unique<Impl>(registry, cfg)) {
  if (cfg.interval_ms == 0) {
    throw std::invalid_argument("DecayTicker: interval_ms must be > 0");
  }
}

DecayTicker::~DecayTicker() { stop(); }

void DecayTicker::start() {
  if (impl_->run.exchange(true)) return;
  if (impl_->cfg.verbose) {
    std::printf("DECAY: ticker started, interval=%u ms\n", impl_->cfg.interval_ms);
  }
  impl_->th = std::thread([this]{ impl_->loop(); });
}

void DecayTicker::stop() {
  if (!impl_->run.exchange(false)) return;
  {
    std::lock_guard lk(impl_->mtx);
  }
  impl_->cv.notify_all();
  if (impl_->th.joinable()) impl_->th.join();
  if (impl_->cfg.verbose) {
    std::printf("DECAY: ticker stopped after %llu steps\n",
                (unsigned long long)impl_->stats.ticks.load());
  }
}

const DecayTicker::Stats& DecayTicker::stats() const noexcept {
  return impl_->stats;
}

} // namespace genpool
