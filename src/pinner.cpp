// ============================================================================
// pinner.cpp -- implementation of the ThreadSlotPinner class
// ============================================================================
#include "genpool/pinner.hpp"

#include <algorithm>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace genpool {

// ============================================================================
// SlotTable: the shared worker slot table. Threads keep weak references to
// it so a thread exiting after the pinner is gone does not touch freed memory.
// ============================================================================
struct ThreadSlotPinner::SlotTable {
  struct alignas(CL) Slot {
    std::atomic<bool> busy{false};   // a thread is pinned here right now
    std::atomic<bool> owned{false};  // home slot of some live thread
  };

  explicit SlotTable(std::size_t n);

  bool try_acquire(std::size_t i) noexcept {
    bool expected = false;
    return slots[i].busy.compare_exchange_strong(expected, true,
                                                 std::memory_order_acquire,
                                                 std::memory_order_relaxed);
  }

  void release(std::size_t i) noexcept {
    slots[i].busy.store(false, std::memory_order_release);
  }

  /// Claim a home slot for a new thread; SIZE_MAX if all are taken.
  std::size_t claim_home() noexcept {
    for (std::size_t i = 0; i < size; ++i) {
      bool expected = false;
      if (slots[i].owned.compare_exchange_strong(expected, true,
                                                 std::memory_order_acq_rel))
        return i;
    }
    return SIZE_MAX;
  }

  void release_home(std::size_t i) noexcept {
    slots[i].owned.store(false, std::memory_order_release);
  }

  const uint64_t          id;
  const std::size_t       size;
  std::unique_ptr<Slot[]> slots;
  std::mutex              world_mtx; // serializes stop_the_world callers
};

namespace {

std::atomic<uint64_t> g_next_table_id{1};

/// Per-thread pin state for one slot table.
struct ThreadPin {
  uint64_t                                   table_id{0};
  std::weak_ptr<ThreadSlotPinner::SlotTable> table;
  std::size_t                                home{SIZE_MAX};
  std::size_t                                current{SIZE_MAX};
  unsigned                                   depth{0};
};

/// All pin states of the calling thread. Home slots go back to their tables
/// when the thread exits.
struct ThreadPins {
  std::vector<ThreadPin> pins;

  ~ThreadPins() {
    for (auto& p : pins) {
      if (p.home == SIZE_MAX) continue;
      if (auto t = p.table.lock()) t->release_home(p.home);
    }
  }

  /// Current nesting depth against table id, without claiming anything.
  unsigned depth_of(uint64_t id) const noexcept {
    for (const auto& p : pins) {
      if (p.table_id == id) return p.depth;
    }
    return 0;
  }

  ThreadPin& find(const std::shared_ptr<ThreadSlotPinner::SlotTable>& t) {
    for (auto& p : pins) {
      if (p.table_id == t->id) return p;
    }
    // First pin against this table: drop states of dead tables, then claim.
    pins.erase(std::remove_if(pins.begin(), pins.end(),
                              [](const ThreadPin& p) { return p.table.expired(); }),
               pins.end());
    ThreadPin p;
    p.table_id = t->id;
    p.table    = t;
    p.home     = t->claim_home();
    pins.push_back(std::move(p));
    return pins.back();
  }
};

thread_local ThreadPins tls_pins;

} // namespace

ThreadSlotPinner::SlotTable::SlotTable(std::size_t n)
: id(g_next_table_id.fetch_add(1, std::memory_order_relaxed)),
  size(n), slots(std::make_unique<Slot[]>(n)) {}

ThreadSlotPinner::ThreadSlotPinner(std::size_t workers) {
  if (workers == 0) workers = std::thread::hardware_concurrency();
  if (workers == 0) workers = 1;
  table_ = std::make_shared<SlotTable>(workers);
}

ThreadSlotPinner::~ThreadSlotPinner() = default;

std::size_t ThreadSlotPinner::pin() {
  ThreadPin& p = tls_pins.find(table_);
  if (p.depth++ > 0) return p.current;

  SlotTable& t = *table_;
  if (p.home != SIZE_MAX && t.try_acquire(p.home)) {
    p.current = p.home;
    return p.current;
  }

  // No home slot, or it is lent out. Borrow any idle slot; only other pinned
  // sections (short) or a decay step can keep them all busy.
  const std::size_t start = p.home != SIZE_MAX
      ? p.home
      : std::hash<std::thread::id>{}(std::this_thread::get_id()) % t.size;
  for (;;) {
    for (std::size_t i = 0; i < t.size; ++i) {
      const std::size_t idx = (start + i) % t.size;
      if (t.try_acquire(idx)) {
        p.current = idx;
        return idx;
      }
    }
    std::this_thread::yield();
  }
}

void ThreadSlotPinner::unpin() {
  ThreadPin& p = tls_pins.find(table_);
  GENPOOL_CHECK(p.depth > 0, "unpin without matching pin");
  if (--p.depth == 0) {
    table_->release(p.current);
    p.current = SIZE_MAX;
  }
}

std::size_t ThreadSlotPinner::worker_count() const noexcept {
  return table_->size;
}

std::size_t ThreadSlotPinner::pin_depth() const {
  return tls_pins.depth_of(table_->id);
}

void ThreadSlotPinner::stop_the_world(const std::function<void()>& fn) {
  GENPOOL_CHECK(tls_pins.depth_of(table_->id) == 0,
                "stop_the_world called while pinned");

  SlotTable& t = *table_;
  std::lock_guard<std::mutex> lk(t.world_mtx);

  for (std::size_t i = 0; i < t.size; ++i) {
    while (!t.try_acquire(i)) std::this_thread::yield();
  }

  // Hand the slots back even if fn throws.
  struct Resume {
    SlotTable& t;
    ~Resume() { for (std::size_t i = 0; i < t.size; ++i) t.release(i); }
  } resume{t};

  fn();
}

ThreadSlotPinner& ThreadSlotPinner::global() {
  static ThreadSlotPinner pinner;
  return pinner;
}

} // namespace genpool
