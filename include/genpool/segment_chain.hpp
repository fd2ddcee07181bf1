// ============================================================================
// segment_chain.hpp -- Growable chain of RingSegments
//
// A doubly-linked list of RingSegments where each new segment is double the
// size of the previous one (capped). The producer only ever pushes into the
// newest segment; consumers pop from the oldest and unlink it once it is
// exhausted. Unlinked segments stay owned by the chain until the producer
// next grows it at a moment when no consumer is inside pop_tail().
// ============================================================================
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "genpool/ring_segment.hpp"

namespace genpool {

// ============================================================================
// ChainLimits: segment sizing policy
// ============================================================================
struct ChainLimits {
  uint32_t initial_capacity { 8 };             // first segment
  uint32_t max_capacity     { kSegmentLimit }; // growth stops here
};

// ============================================================================
// SegmentChain
// ============================================================================
template <class T>
class SegmentChain {
public:
  /// Constructor for the SegmentChain class.
  /// @param limits Initial and maximum segment capacities (powers of two).
  explicit SegmentChain(ChainLimits limits = {}) { set_limits(limits); }

  ~SegmentChain() {
    // Iterative teardown so long chains do not recurse.
    std::unique_ptr<Link> cur = std::move(first_);
    while (cur) cur = std::move(cur->owned_next);
  }

  SegmentChain(const SegmentChain&) = delete;
  SegmentChain& operator=(const SegmentChain&) = delete;

  /// Replace the sizing policy. Only valid before the first push.
  /// @param limits Initial and maximum segment capacities.
  void set_limits(ChainLimits limits) {
    validate(limits);
    limits_ = limits;
  }

  /// Throw std::invalid_argument unless both capacities are powers of two
  /// and initial <= max <= kSegmentLimit.
  static void validate(const ChainLimits& limits) {
    auto pow2 = [](uint32_t v) { return v != 0 && (v & (v - 1)) == 0; };
    if (!pow2(limits.initial_capacity) || !pow2(limits.max_capacity)) {
      throw std::invalid_argument("chain capacities must be powers of two");
    }
    if (limits.max_capacity > kSegmentLimit ||
        limits.initial_capacity > limits.max_capacity) {
      throw std::invalid_argument("invalid chain capacity limits");
    }
  }

  /// Push at the head, growing the chain when the newest segment is full.
  /// Producer only.
  /// @param v The value to push.
  void push_head(T v) {
    Link* d = head_;
    if (d == nullptr) {
      first_ = std::make_unique<Link>(limits_.initial_capacity);
      d = first_.get();
      head_ = d;
      tail_.store(d, std::memory_order_release);
    }
    if (d->seg.push_head(v)) return;

    // The current head is full. Free what consumers left behind, then
    // allocate a new segment twice as large.
    reclaim();
    uint64_t grown = uint64_t(d->seg.capacity()) << 1;
    if (grown > limits_.max_capacity) grown = limits_.max_capacity;

    d->owned_next = std::make_unique<Link>(uint32_t(grown));
    Link* d2 = d->owned_next.get();
    d2->prev.store(d, std::memory_order_relaxed);
    head_ = d2;
    d->next.store(d2, std::memory_order_release);
    d2->seg.push_head(v);
  }

  /// Pop at the head, newest segment first. Producer only.
  /// @return A value, or nullopt if every segment is empty.
  std::optional<T> pop_head() {
    // Segments behind the tail are exhausted and may already be freed.
    Link* const oldest = tail_.load(std::memory_order_acquire);
    for (Link* d = head_; d != nullptr;
         d = d == oldest ? nullptr : d->prev.load(std::memory_order_acquire)) {
      if (auto v = d->seg.pop_head()) return v;
    }
    return std::nullopt;
  }

  /// Pop at the tail, oldest segment first. Safe from any thread.
  /// @return A value, or nullopt if the chain is empty.
  std::optional<T> pop_tail() {
    ReaderScope scope(readers_);
    Link* d = tail_.load();
    if (d == nullptr) return std::nullopt;

    for (;;) {
      // Load next before popping: if d is empty and d2 already existed, no
      // further push can ever land in d, so d is permanently exhausted.
      Link* d2 = d->next.load(std::memory_order_acquire);
      if (auto v = d->seg.pop_tail()) return v;
      if (d2 == nullptr) return std::nullopt;

      // Unlink d. Whoever wins the CAS also cuts the back link so the
      // producer's pop_head walk stops at d2.
      if (tail_.compare_exchange_strong(d, d2)) {
        d2->prev.store(nullptr, std::memory_order_release);
      }
      d = d2;
    }
  }

  /// Capacities of the segments still reachable from the head, oldest first.
  /// Producer side diagnostic.
  std::vector<uint32_t> segment_capacities() const {
    std::vector<uint32_t> caps;
    Link* const oldest = tail_.load(std::memory_order_acquire);
    for (Link* d = head_; d != nullptr;
         d = d == oldest ? nullptr : d->prev.load(std::memory_order_acquire)) {
      caps.insert(caps.begin(), d->seg.capacity());
    }
    return caps;
  }

  /// Number of segments held, including unlinked ones not yet reclaimed.
  /// Producer side diagnostic.
  std::size_t segments_allocated() const noexcept {
    std::size_t n = 0;
    for (const Link* d = first_.get(); d != nullptr; d = d->owned_next.get()) ++n;
    return n;
  }

private:
  // Counts consumers inside pop_tail() for the span of the call.
  struct ReaderScope {
    explicit ReaderScope(std::atomic<uint32_t>& n) : n_(n) { n_.fetch_add(1); }
    ~ReaderScope() { n_.fetch_sub(1, std::memory_order_release); }
    std::atomic<uint32_t>& n_;
  };

  /// Free the segments consumers have unlinked. Producer only.
  ///
  /// A consumer can only reach an unlinked segment if it entered pop_tail()
  /// before the unlink. The tail is read first, the reader count second; both
  /// sequentially consistent, so a zero count proves every consumer that
  /// could still see a segment behind that tail has left.
  void reclaim() noexcept {
    Link* const live = tail_.load();
    if (live == nullptr || readers_.load() != 0) return;
    while (first_.get() != live) first_ = std::move(first_->owned_next);
  }

  struct Link {
    explicit Link(uint32_t capacity) : seg(capacity) {}

    RingSegment<T>     seg;
    std::atomic<Link*> next{nullptr};
    std::atomic<Link*> prev{nullptr};
    std::unique_ptr<Link> owned_next; // ownership follows creation order
  };

  ChainLimits           limits_;
  std::unique_ptr<Link> first_;          // oldest segment not yet freed
  Link*                 head_{nullptr};  // producer only
  std::atomic<Link*>    tail_{nullptr};  // consumers CAS this forward
  std::atomic<uint32_t> readers_{0};     // consumers inside pop_tail()
};

} // namespace genpool
