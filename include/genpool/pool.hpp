// ============================================================================
// pool.hpp -- Generational per-worker object pool
//
// Pool<T> recycles caller-supplied values across worker threads. Each worker
// owns a Local: a private single-value slot plus a SegmentChain that the owner
// pushes/pops at the head and other workers steal from at the tail. Locals
// come in two generations: the current one, allocated lazily on first use,
// and the victim one left behind by the last decay step. See registry.hpp for
// the decay protocol.
//
// Core guarantees:
// - put()/get() never block outside the one-off generation allocation.
// - The factory is never called while pinned.
// - Values may be dropped instead of reused; get() may return any pooled
//   value, in any order.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "genpool/metrics.hpp"
#include "genpool/pinner.hpp"
#include "genpool/registry.hpp"
#include "genpool/segment_chain.hpp"

namespace genpool {

// ============================================================================
// Empty values: null pointers are never pooled.
// ============================================================================
template <class T>
struct EmptyValue {
  static bool test(const T&) noexcept { return false; }
};
template <class U>
struct EmptyValue<U*> {
  static bool test(U* p) noexcept { return p == nullptr; }
};
template <class U, class D>
struct EmptyValue<std::unique_ptr<U, D>> {
  static bool test(const std::unique_ptr<U, D>& p) noexcept { return !p; }
};
template <class U>
struct EmptyValue<std::shared_ptr<U>> {
  static bool test(const std::shared_ptr<U>& p) noexcept { return !p; }
};

namespace detail {
/// Cheap per-thread xorshift used by race diagnostics.
inline uint32_t fast_rand(uint32_t n) noexcept {
  thread_local uint32_t x = 0x9e3779b9u ^
      uint32_t(reinterpret_cast<std::uintptr_t>(&x) >> 4);
  x ^= x << 13;
  x ^= x >> 17;
  x ^= x << 5;
  return uint32_t((uint64_t(x) * n) >> 32);
}
} // namespace detail

// ============================================================================
// `PoolConfig` struct
// ============================================================================
struct PoolConfig {
  uint32_t initial_segment { 8 };              // first chain segment
  uint32_t max_segment     { kSegmentLimit };  // chain growth cap
};

// ============================================================================
// `Pool` class
// ============================================================================
template <class T>
class Pool final : public PoolBase {
public:
  using Factory = std::function<T()>;

  /// Constructor for the Pool class.
  /// @param factory Produces a value when get() finds the pool empty.
  /// @param cfg Chain sizing.
  /// @param registry Registry (and through it the pinner) to use.
  explicit Pool(Factory factory = {}, PoolConfig cfg = {},
                Registry& registry = Registry::global())
  : factory_(std::move(factory)),
    limits_{cfg.initial_segment, cfg.max_segment},
    registry_(registry),
    pinner_(registry.pinner()),
    metrics_(registry.pinner().worker_count()) {
    SegmentChain<T>::validate(limits_);
  }

  ~Pool() override {
    registry_.withdraw(this);
  }

  Pool(const Pool&) = delete;
  Pool& operator=(const Pool&) = delete;

  /// Add a value to the pool. Empty values are ignored.
  /// @param x The value to recycle.
  void put(T x) {
    if (EmptyValue<T>::test(x)) return;

#if defined(GENPOOL_RACE_DIAGNOSTICS)
    // Randomly drop x on the floor so callers relying on identity break.
    if (detail::fast_rand(4) == 0) {
      metrics_.mark_dropped();
      return;
    }
#endif

    PinGuard pin(pinner_);
    Local* l = local_for(pin);
    if (!l->private_value) {
      l->private_value.emplace(std::move(x));
    } else {
      l->shared.push_head(std::move(x));
    }
    metrics_.mark_put(pin.pid());
  }

  /// Add a value if engaged.
  /// @param x The value to recycle, or nullopt for a no-op.
  void put(std::optional<T> x) {
    if (x) put(std::move(*x));
  }

  /// Remove an arbitrary value from the pool. Falls back to the factory if
  /// the pool is empty.
  /// @return A pooled or freshly made value, or nullopt if the pool is empty
  ///         and there is no factory.
  std::optional<T> get() {
    std::optional<T> x = take();
    if (!x && factory_) {
      metrics_.mark_factory_call();
      return factory_();
    }
    return x;
  }

  /// Replace the factory. Not safe concurrently with get().
  void set_factory(Factory f) { factory_ = std::move(f); }

  const PoolMetrics& metrics() const noexcept { return metrics_; }
  PoolMetrics& metrics() noexcept { return metrics_; }

  /// Size of the current generation; 0 until first use and after decay.
  std::size_t current_size() const noexcept {
    return local_size_.load(std::memory_order_acquire);
  }

  /// Size of the victim generation; 0 once it is exhausted or discarded.
  std::size_t victim_size() const noexcept {
    return victim_size_.load(std::memory_order_acquire);
  }

private:
  // One per worker. Aligned so two workers never share a cache line.
  struct alignas(CL) Local {
    std::optional<T> private_value; // owner only, while pinned
    SegmentChain<T>  shared;        // owner: head, anyone: tail
  };
  static_assert(sizeof(Local) % CL == 0, "Local must fill whole cache lines");

  /// Pooled value from the private slot, the shared chain, or the slow path.
  /// The pin is released before returning.
  std::optional<T> take() {
    PinGuard pin(pinner_);
    Local* l = local_for(pin);
    const std::size_t pid = pin.pid();

    if (l->private_value) {
      std::optional<T> x(std::move(l->private_value));
      l->private_value.reset();
      metrics_.mark_private_hit(pid);
      return x;
    }
    if (auto x = l->shared.pop_head()) {
      metrics_.mark_shared_hit(pid);
      return x;
    }
    return get_slow(pid);
  }

  /// Return the pinned worker's Local in the current generation.
  Local* local_for(PinGuard& pin) {
    const std::size_t pid = pin.pid();
    GENPOOL_CHECK(pid < pinner_.worker_count(), "pinner index out of range");
    const std::size_t s = local_size_.load(std::memory_order_acquire);
    Local* l = local_.load(std::memory_order_relaxed);
    if (pid < s) return &l[pid];
    return pin_slow(pin);
  }

  /// Allocate the current generation. Unpins while waiting for the
  /// registration lock so a decay step is never blocked by us; a caller that
  /// still holds an outer pin would deadlock against decay, so that aborts.
  Local* pin_slow(PinGuard& pin) {
    pin.unpin();
    GENPOOL_CHECK(pinner_.pin_depth() == 0,
                  "pool used while the caller holds a pin");
    auto lk = registry_.lock_registration();

    const std::size_t size = pinner_.worker_count();
    std::unique_ptr<Local[]> fresh;
    if (local_.load(std::memory_order_relaxed) == nullptr) {
      fresh = std::make_unique<Local[]>(size);
      for (std::size_t i = 0; i < size; ++i) fresh[i].shared.set_limits(limits_);
    }

    pin.repin();
    const std::size_t pid = pin.pid();
    GENPOOL_CHECK(pid < size, "pinner index out of range");
    const std::size_t s = local_size_.load(std::memory_order_relaxed);
    Local* l = local_.load(std::memory_order_relaxed);
    if (pid < s) return &l[pid];

    // Worker count is fixed, so a live generation always covers pid.
    GENPOOL_CHECK(l == nullptr && fresh, "generation smaller than worker count");

    registry_.enroll(this);
    l = fresh.get();
    local_owner_ = std::move(fresh);
    local_.store(l, std::memory_order_release);
    local_size_.store(size, std::memory_order_release);
    return &l[pid];
  }

  /// Steal from other workers, then fall back to the victim generation.
  std::optional<T> get_slow(std::size_t pid) {
    std::size_t size = local_size_.load(std::memory_order_acquire);
    Local* locals = local_.load(std::memory_order_relaxed);

    // Start after our own index to spread contention.
    for (std::size_t i = 0; i < size; ++i) {
      Local& l = locals[(pid + i + 1) % size];
      if (auto x = l.shared.pop_tail()) {
        metrics_.mark_steal(pid);
        return x;
      }
    }

    // Try the victim cache. It is no longer pushed to, so anything found
    // there is the last chance to reuse it before the next decay.
    size = victim_size_.load(std::memory_order_acquire);
    if (pid >= size) {
      metrics_.mark_miss(pid);
      return std::nullopt;
    }
    locals = victim_.load(std::memory_order_relaxed);
    Local& mine = locals[pid];
    if (mine.private_value) {
      std::optional<T> x(std::move(mine.private_value));
      mine.private_value.reset();
      metrics_.mark_victim_hit(pid);
      return x;
    }
    for (std::size_t i = 0; i < size; ++i) {
      Local& l = locals[(pid + i) % size];
      if (auto x = l.shared.pop_tail()) {
        metrics_.mark_victim_hit(pid);
        return x;
      }
    }

    // Victim is exhausted; stop looking at it. Its memory goes at the next
    // decay step, when nobody can still be inside it.
    victim_size_.store(0, std::memory_order_release);
    metrics_.mark_miss(pid);
    return std::nullopt;
  }

  void drop_victim() noexcept override {
    victim_.store(nullptr, std::memory_order_relaxed);
    victim_size_.store(0, std::memory_order_relaxed);
    victim_owner_.reset();
  }

  void demote_generation() noexcept override {
    victim_owner_ = std::move(local_owner_);
    victim_.store(local_.load(std::memory_order_relaxed),
                  std::memory_order_relaxed);
    victim_size_.store(local_size_.load(std::memory_order_relaxed),
                       std::memory_order_relaxed);
    local_.store(nullptr, std::memory_order_relaxed);
    local_size_.store(0, std::memory_order_relaxed);
  }

  Factory           factory_;
  const ChainLimits limits_;
  Registry&         registry_;
  WorkerPinner&     pinner_;
  PoolMetrics       metrics_;

  // Read on every operation, written once per generation.
  alignas(CL) std::atomic<Local*>      local_{nullptr};
  std::atomic<std::size_t>             local_size_{0};
  alignas(CL) std::atomic<Local*>      victim_{nullptr};
  std::atomic<std::size_t>             victim_size_{0};

  std::unique_ptr<Local[]> local_owner_;
  std::unique_ptr<Local[]> victim_owner_;
};

} // namespace genpool
