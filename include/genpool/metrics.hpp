// ============================================================================
// metrics.hpp -- per-pool hit/miss counters
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>

#include "genpool/ring_segment.hpp"   // For genpool::CL

namespace genpool {

// ============================================================================
// `PoolMetricsSnapshot` struct
// Totals across all workers at a point in time.
// ============================================================================
struct PoolMetricsSnapshot {
  std::uint64_t puts{0};
  std::uint64_t private_hits{0};   // get() served by the private slot
  std::uint64_t shared_hits{0};    // get() served by the own chain head
  std::uint64_t steals{0};         // get() served by another worker's chain
  std::uint64_t victim_hits{0};    // get() served by the victim generation
  std::uint64_t misses{0};         // get() found nothing
  std::uint64_t factory_calls{0};
  std::uint64_t dropped{0};        // put() values dropped by race diagnostics

  // derived
  std::uint64_t gets{0};
  double        hit_ratio{0.0};
};

// ============================================================================
// `PoolMetrics` class
// Counters are sharded per worker and padded to a cache line, so the hot path
// only ever touches the pinned worker's line.
// ============================================================================
class PoolMetrics {
public:
  /// Constructor for the PoolMetrics class.
  /// @param workers Number of worker shards.
  explicit PoolMetrics(std::size_t workers);

  PoolMetrics(const PoolMetrics&) = delete;
  PoolMetrics& operator=(const PoolMetrics&) = delete;

  // Per-worker events, called while pinned to pid.
  void mark_put(std::size_t pid)          { bump(shards_[pid].puts); }
  void mark_private_hit(std::size_t pid)  { bump(shards_[pid].private_hits); }
  void mark_shared_hit(std::size_t pid)   { bump(shards_[pid].shared_hits); }
  void mark_steal(std::size_t pid)        { bump(shards_[pid].steals); }
  void mark_victim_hit(std::size_t pid)   { bump(shards_[pid].victim_hits); }
  void mark_miss(std::size_t pid)         { bump(shards_[pid].misses); }

  // Pool-wide events, called unpinned.
  void mark_factory_call() { bump(factory_calls_); }
  void mark_dropped()      { bump(dropped_); }

  /// Reset all counters (careful if other threads are writing).
  void reset();

  /// Sum the shards and compute derived values.
  PoolMetricsSnapshot snapshot() const;

  /// Pretty-print a snapshot to a FILE* (stdout by default).
  /// @param out Destination stream.
  /// @param name Label printed in the header line.
  void print(std::FILE* out = stdout, const char* name = "pool") const;

private:
  static void bump(std::atomic<std::uint64_t>& c) {
    c.fetch_add(1, std::memory_order_relaxed);
  }

  struct alignas(CL) Shard {
    std::atomic<std::uint64_t> puts{0};
    std::atomic<std::uint64_t> private_hits{0};
    std::atomic<std::uint64_t> shared_hits{0};
    std::atomic<std::uint64_t> steals{0};
    std::atomic<std::uint64_t> victim_hits{0};
    std::atomic<std::uint64_t> misses{0};
  };

  const std::size_t        workers_;
  std::unique_ptr<Shard[]> shards_;

  alignas(CL) std::atomic<std::uint64_t> factory_calls_{0};
  std::atomic<std::uint64_t>             dropped_{0};
};

} // namespace genpool
