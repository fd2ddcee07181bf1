// ============================================================================
// registry.hpp -- Generation registry and decay protocol
//
// Every Pool keeps two generations of per-worker caches: the current one and
// the victim one from the previous decay cycle. The Registry tracks which
// pools hold either and runs the decay step that ages victims out and demotes
// current generations to victims, bounding retention to two decay cycles.
//
// Registration happens under a single mutex. The decay step needs exclusive
// access to all registered pools; decay() obtains it from the pinner,
// decay_exclusive() assumes the caller already holds it.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "genpool/pinner.hpp"

namespace genpool {

class Registry;

// ============================================================================
// `PoolBase` class
// Type-erased view of a Pool<T> used by the Registry.
// ============================================================================
class PoolBase {
public:
  virtual ~PoolBase() = default;

protected:
  friend class Registry;

  /// Discard the victim generation. Called inside the decay window.
  virtual void drop_victim() noexcept = 0;

  /// Move the current generation into the victim slot, discarding whatever
  /// victim existed. Called inside the decay window.
  virtual void demote_generation() noexcept = 0;
};

// ============================================================================
// `Registry` class
// ============================================================================
class Registry {
public:
  /// Constructor for the Registry class.
  /// @param pinner The pinner every pool of this registry pins through.
  explicit Registry(WorkerPinner& pinner);
  ~Registry();

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  WorkerPinner& pinner() const noexcept { return pinner_; }

  /// Lock guarding registration; held by pools while allocating a
  /// generation.
  std::unique_lock<std::mutex> lock_registration() {
    return std::unique_lock<std::mutex>(mtx_);
  }

  /// Record that pool now has a current generation. Caller holds
  /// lock_registration().
  void enroll(PoolBase* pool);

  /// Forget pool entirely. Called from the pool's destructor.
  void withdraw(PoolBase* pool);

  /// Run one decay step, stopping the world through the pinner. Never runs
  /// concurrently with itself. Must not be called while pinned.
  void decay();

  /// Run one decay step assuming no pool operation is in flight.
  void decay_exclusive();

  std::size_t current_pools() const;
  std::size_t victim_pools() const;
  uint64_t decay_count() const noexcept {
    return decays_.load(std::memory_order_relaxed);
  }

  /// Registry bound to ThreadSlotPinner::global().
  static Registry& global();

private:
  void decay_locked();

  WorkerPinner&          pinner_;
  mutable std::mutex     mtx_;
  std::vector<PoolBase*> pools_;     // pools with a current generation
  std::vector<PoolBase*> old_pools_; // pools that may have a victim generation
  std::atomic<uint64_t>  decays_{0};
};

} // namespace genpool
