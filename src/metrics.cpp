// ============================================================================
// metrics.cpp -- implementation of PoolMetrics
//
// PoolMetrics tracks the following counters per pool:
//
// puts           : Values handed to put() and kept.
// private_hits   : get() calls satisfied by the worker's private slot.
// shared_hits    : get() calls satisfied by the worker's own chain head.
// steals         : get() calls satisfied by another worker's chain tail.
// victim_hits    : get() calls satisfied by the previous generation.
// misses         : get() calls that found nothing pooled.
// factory_calls  : Misses turned into a fresh value by the factory.
// dropped        : Values discarded on purpose by race diagnostics.
// ============================================================================
#include "genpool/metrics.hpp"

namespace genpool {

PoolMetrics::PoolMetrics(std::size_t workers)
  : workers_(workers),
    shards_(std::make_unique<Shard[]>(workers))
{}

void PoolMetrics::reset() {
  for (std::size_t i = 0; i < workers_; ++i) {
    Shard& s = shards_[i];
    s.puts.store(0, std::memory_order_relaxed);
    s.private_hits.store(0, std::memory_order_relaxed);
    s.shared_hits.store(0, std::memory_order_relaxed);
    s.steals.store(0, std::memory_order_relaxed);
    s.victim_hits.store(0, std::memory_order_relaxed);
    s.misses.store(0, std::memory_order_relaxed);
  }
  factory_calls_.store(0, std::memory_order_relaxed);
  dropped_.store(0, std::memory_order_relaxed);
}

PoolMetricsSnapshot PoolMetrics::snapshot() const {
  PoolMetricsSnapshot s{};

  for (std::size_t i = 0; i < workers_; ++i) {
    const Shard& sh = shards_[i];
    s.puts         += sh.puts.load(std::memory_order_relaxed);
    s.private_hits += sh.private_hits.load(std::memory_order_relaxed);
    s.shared_hits  += sh.shared_hits.load(std::memory_order_relaxed);
    s.steals       += sh.steals.load(std::memory_order_relaxed);
    s.victim_hits  += sh.victim_hits.load(std::memory_order_relaxed);
    s.misses       += sh.misses.load(std::memory_order_relaxed);
  }
  s.factory_calls = factory_calls_.load(std::memory_order_relaxed);
  s.dropped       = dropped_.load(std::memory_order_relaxed);

  // Derived
  const std::uint64_t hits =
      s.private_hits + s.shared_hits + s.steals + s.victim_hits;
  s.gets = hits + s.misses;
  s.hit_ratio = s.gets ? double(hits) / double(s.gets) : 0.0;

  return s;
}

void PoolMetrics::print(std::FILE* out, const char* name) const {
  PoolMetricsSnapshot s = snapshot();

  std::fprintf(out,
    "\n=== Pool Stats (%s) ===\n"
    "PUT:    kept=%llu  dropped=%llu\n"
    "GET:    total=%llu  private=%llu  shared=%llu  steals=%llu  victim=%llu\n"
    "MISS:   misses=%llu  factory_calls=%llu\n"
    "Hit ratio: %.2f%%\n",
    name,
    (unsigned long long)s.puts,
    (unsigned long long)s.dropped,
    (unsigned long long)s.gets,
    (unsigned long long)s.private_hits,
    (unsigned long long)s.shared_hits,
    (unsigned long long)s.steals,
    (unsigned long long)s.victim_hits,
    (unsigned long long)s.misses,
    (unsigned long long)s.factory_calls,
    s.hit_ratio * 100.0
  );
}

} // namespace genpool
