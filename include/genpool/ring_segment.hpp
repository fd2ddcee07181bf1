// ============================================================================
// ring_segment.hpp -- Single-Producer Multi-Consumer Ring Segment
//
// Fixed-capacity circular buffer backing one link of a SegmentChain. The
// owning producer pushes and pops at the head; any thread may pop at the tail.
// Head and tail are packed into one 64-bit word so fullness checks and both
// pops reduce to a single compare-and-swap.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace genpool {

#if defined(__cpp_lib_hardware_interference_size)
constexpr std::size_t CL = std::hardware_destructive_interference_size;
#else
constexpr std::size_t CL = 64;
#endif

/// Number of bits used by each of the packed head/tail indices.
constexpr unsigned kIndexBits = 32;

/// Largest permitted segment capacity. Fullness detection relies on the ring
/// wrapping before the 32-bit index does, so this must stay at or below
/// 2^31; a quarter of the index space keeps a comfortable margin.
constexpr uint32_t kSegmentLimit = uint32_t(1) << (kIndexBits - 2);

// ============================================================================
// RingSegment: lock-free SPMC ring with presence-tagged slots
// ============================================================================
template <class T>
class RingSegment {
  static_assert(std::is_move_constructible_v<T>,
                "pooled values must be move constructible");

public:
  /// Constructor for the RingSegment class.
  /// @param capacity Number of slots; must be a power of two in
  ///                 [1, kSegmentLimit].
  /// @param start_index Initial value of both head and tail. Only useful to
  ///                    exercise the 32-bit wraparound in tests.
  explicit RingSegment(uint32_t capacity, uint32_t start_index = 0)
  : cap_(capacity), mask_(capacity - 1) {
    if (capacity == 0 || (capacity & (capacity - 1)) != 0) {
      throw std::invalid_argument("segment capacity must be a power of two");
    }
    if (capacity > kSegmentLimit) {
      throw std::invalid_argument("segment capacity exceeds limit");
    }
    slots_ = std::make_unique<Slot[]>(capacity);
    head_tail_.store(pack(start_index, start_index), std::memory_order_relaxed);
  }

  RingSegment(const RingSegment&) = delete;
  RingSegment& operator=(const RingSegment&) = delete;

  /// Push at the head. Producer only.
  /// @param v The value to push; left untouched when the push fails.
  /// @return True if the value was stored, false if the segment is full.
  bool push_head(T& v) {
    const uint64_t ptrs = head_tail_.load(std::memory_order_acquire);
    const uint32_t head = unpack_head(ptrs);
    const uint32_t tail = unpack_tail(ptrs);
    if (uint32_t(tail + cap_) == head) return false; // full

    // A consumer that won this slot's tail CAS may still be moving the value
    // out; the slot is not ours until it drops the flag.
    Slot& s = slots_[head & mask_];
    if (s.occupied.load(std::memory_order_acquire)) return false;

    s.value.emplace(std::move(v));
    s.occupied.store(true, std::memory_order_relaxed);

    // Only the producer touches head, so a plain add publishes the slot.
    head_tail_.fetch_add(uint64_t(1) << kIndexBits, std::memory_order_release);
    return true;
  }

  /// Pop at the head. Producer only.
  /// @return The most recently pushed value, or nullopt if empty.
  std::optional<T> pop_head() {
    uint64_t ptrs = head_tail_.load(std::memory_order_acquire);
    uint32_t head;
    for (;;) {
      head = unpack_head(ptrs);
      const uint32_t tail = unpack_tail(ptrs);
      if (head == tail) return std::nullopt; // empty
      --head;
      if (head_tail_.compare_exchange_weak(ptrs, pack(head, tail),
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire))
        break;
    }
    return take(slots_[head & mask_]);
  }

  /// Pop at the tail. Safe from any number of consumers.
  /// @return The oldest value, or nullopt if empty.
  std::optional<T> pop_tail() {
    uint64_t ptrs = head_tail_.load(std::memory_order_acquire);
    uint32_t tail;
    for (;;) {
      const uint32_t head = unpack_head(ptrs);
      tail = unpack_tail(ptrs);
      if (head == tail) return std::nullopt; // empty
      if (head_tail_.compare_exchange_weak(ptrs, pack(head, tail + 1),
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire))
        break;
    }
    return take(slots_[tail & mask_]);
  }

  uint32_t capacity() const noexcept { return cap_; }

  /// Racy snapshot; exact only when no operation is in flight.
  /// @return Number of values currently held.
  uint32_t size() const noexcept {
    const uint64_t ptrs = head_tail_.load(std::memory_order_acquire);
    return unpack_head(ptrs) - unpack_tail(ptrs);
  }

  bool empty() const noexcept { return size() == 0; }

private:
  struct Slot {
    std::atomic<bool> occupied{false};
    std::optional<T>  value;
  };

  /// Move the value out and release the slot back to the producer.
  static std::optional<T> take(Slot& s) {
    std::optional<T> out(std::move(s.value));
    s.value.reset();
    s.occupied.store(false, std::memory_order_release);
    return out;
  }

  static inline uint64_t pack(uint32_t head, uint32_t tail) noexcept {
    return (uint64_t(head) << kIndexBits) | uint64_t(tail);
  }
  static inline uint32_t unpack_head(uint64_t v) noexcept {
    return uint32_t(v >> kIndexBits); }
  static inline uint32_t unpack_tail(uint64_t v) noexcept {
    return uint32_t(v & 0xffffffffu); }

  alignas(CL) std::atomic<uint64_t> head_tail_{0}; // head: high, tail: low
  const uint32_t cap_;
  const uint32_t mask_;
  std::unique_ptr<Slot[]> slots_;
};

} // namespace genpool
