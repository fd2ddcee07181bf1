// ============================================================================
// pinner.hpp -- Worker pinning capability
//
// A Pool shards its caches per worker. The pinner hands the calling thread
// a worker index and guarantees nobody else uses that index until unpin().
// It also provides the stop-the-world window the decay step needs: while
// stop_the_world() runs its callback, no worker is pinned anywhere.
//
// Types defined:
// - WorkerPinner: abstract capability injected into every Registry.
// - ThreadSlotPinner: default implementation backed by a fixed table of
//   cache-line padded worker slots.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>

#include "genpool/ring_segment.hpp"   // For genpool::CL

/// Fail-fast check for programming errors that would corrupt pool state.
#define GENPOOL_CHECK(cond, msg) do{ \
  if(!(cond)){ \
    std::fprintf(stderr,"GENPOOL: fatal: %s (%s) @ %s:%d\n", \
                 msg,#cond,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

namespace genpool {

// ============================================================================
// `WorkerPinner` class
// ============================================================================
class WorkerPinner {
public:
  virtual ~WorkerPinner() = default;

  /// Pin the calling thread to a worker slot. Re-entrant per thread.
  /// @return The worker index, always below worker_count().
  virtual std::size_t pin() = 0;

  /// Undo one pin().
  virtual void unpin() = 0;

  /// Number of worker slots. Must not change for the lifetime of the pinner.
  virtual std::size_t worker_count() const noexcept = 0;

  /// Pins the calling thread currently holds on this pinner.
  virtual std::size_t pin_depth() const = 0;

  /// Run fn while no worker is pinned. Must not be called while pinned.
  /// @param fn The callback to run inside the exclusive window.
  virtual void stop_the_world(const std::function<void()>& fn) = 0;
};

// ============================================================================
// `PinGuard` class
// Holds one pin for the enclosing scope.
// ============================================================================
class PinGuard {
public:
  explicit PinGuard(WorkerPinner& pinner) : pinner_(pinner), pid_(pinner.pin()) {}
  ~PinGuard() { unpin(); }

  PinGuard(const PinGuard&) = delete;
  PinGuard& operator=(const PinGuard&) = delete;

  std::size_t pid() const noexcept { return pid_; }

  /// Give the pin back before the scope ends. No-op if already unpinned.
  void unpin() {
    if (!pinned_) return;
    pinned_ = false;
    pinner_.unpin();
  }

  /// Pin again after unpin(); the worker index may change.
  void repin() {
    pid_ = pinner_.pin();
    pinned_ = true;
  }

private:
  WorkerPinner& pinner_;
  std::size_t   pid_;
  bool          pinned_{true};
};

// ============================================================================
// `ThreadSlotPinner` class
// Each thread claims a home slot on its first pin() and gives it back when it
// exits. Pinning flips the slot's busy flag; a thread that found no free home
// slot borrows whichever slot is idle.
// ============================================================================
class ThreadSlotPinner final : public WorkerPinner {
public:
  /// Constructor for the ThreadSlotPinner class.
  /// @param workers Number of worker slots; 0 means hardware_concurrency().
  explicit ThreadSlotPinner(std::size_t workers = 0);
  ~ThreadSlotPinner() override;

  ThreadSlotPinner(const ThreadSlotPinner&) = delete;
  ThreadSlotPinner& operator=(const ThreadSlotPinner&) = delete;

  std::size_t pin() override;
  void unpin() override;
  std::size_t worker_count() const noexcept override;
  std::size_t pin_depth() const override;
  void stop_the_world(const std::function<void()>& fn) override;

  /// Process-wide pinner used by Registry::global().
  static ThreadSlotPinner& global();

  struct SlotTable;

private:
  std::shared_ptr<SlotTable> table_;
};

} // namespace genpool
