// ============================================================================
// test_pool.cpp -- Test Pool put/get, stealing and generational decay
// ============================================================================
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>
#include "genpool/pool.hpp"
#include "genpool/registry.hpp"
#include "manual_pinner.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%lld %s=%lld @ %s:%d\n", \
                 #a,(long long)_va,#b,(long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using genpool::Pool;
using genpool::Registry;

constexpr std::size_t WORKERS = 4;

// ============================================================================
// Test 1: single worker round trip, then the factory
// ============================================================================
void test_round_trip() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);
  Pool<int> pool([]{ return 0; }, {}, registry);

  pinner.set_worker(0);
  pool.put(1);
  pool.put(2);
  pool.put(3);

  std::vector<int> got;
  for (int i = 0; i < 3; ++i) {
    auto v = pool.get();
    EXPECT_TRUE(v);
    got.push_back(*v);
  }
  std::sort(got.begin(), got.end());
  EXPECT_TRUE((got == std::vector<int>{1, 2, 3}));

  auto v = pool.get();
  EXPECT_TRUE(v);
  EXPECT_EQ(*v, 0);

  auto s = pool.metrics().snapshot();
  EXPECT_EQ(s.puts, 3u);
  EXPECT_EQ(s.private_hits, 1u);
  EXPECT_EQ(s.shared_hits, 2u);
  EXPECT_EQ(s.factory_calls, 1u);
  EXPECT_EQ(pinner.depth(), 0);
  std::puts("round trip: OK");
}

// ============================================================================
// Test 2: no factory means an empty pool yields nullopt
// ============================================================================
void test_no_factory() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);
  Pool<int> pool({}, {}, registry);

  pinner.set_worker(2);
  EXPECT_TRUE(!pool.get());
  EXPECT_EQ(pool.metrics().snapshot().misses, 1u);

  // zero is an ordinary value
  pool.put(0);
  auto v = pool.get();
  EXPECT_TRUE(v.has_value());
  EXPECT_EQ(*v, 0);
  EXPECT_TRUE(!pool.get());
  std::puts("no factory: OK");
}

// ============================================================================
// Test 3: empty values are ignored
// ============================================================================
void test_empty_values() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);

  Pool<std::unique_ptr<int>> ptrs({}, {}, registry);
  ptrs.put(std::unique_ptr<int>{});
  EXPECT_EQ(ptrs.metrics().snapshot().puts, 0u);
  EXPECT_EQ(ptrs.current_size(), std::size_t(0)); // never even pinned
  EXPECT_TRUE(!ptrs.get());

  ptrs.put(std::make_unique<int>(7));
  auto p = ptrs.get();
  EXPECT_TRUE(p && *p && **p == 7);

  Pool<int> ints({}, {}, registry);
  ints.put(std::optional<int>{});
  EXPECT_EQ(ints.metrics().snapshot().puts, 0u);
  ints.put(std::optional<int>{5});
  auto v = ints.get();
  EXPECT_TRUE(v);
  EXPECT_EQ(*v, 5);
  std::puts("empty values: OK");
}

// ============================================================================
// Test 4: another worker steals through the slow path
// ============================================================================
void test_cross_worker_steal() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);
  Pool<int> pool([]{ return -1; }, {}, registry);

  // Worker 0: first value parks in its private slot, the second is shared.
  pinner.set_worker(0);
  pool.put(7);
  pool.put(42);

  pinner.set_worker(1);
  auto v = pool.get();
  EXPECT_TRUE(v);
  EXPECT_EQ(*v, 42);
  EXPECT_EQ(pool.metrics().snapshot().steals, 1u);

  // The private slot is only for its owner.
  v = pool.get();
  EXPECT_EQ(*v, -1);
  pinner.set_worker(0);
  v = pool.get();
  EXPECT_EQ(*v, 7);
  std::puts("cross worker steal: OK");
}

// ============================================================================
// Test 5: same, with real threads as the two workers
// ============================================================================
void test_cross_thread_steal() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);
  Pool<int> pool({}, {}, registry);

  std::thread a([&]{
    pinner.set_worker(0);
    pool.put(100);
    pool.put(200);
  });
  a.join();

  std::optional<int> got;
  std::thread b([&]{
    pinner.set_worker(3);
    got = pool.get();
  });
  b.join();

  EXPECT_TRUE(got);
  EXPECT_EQ(*got, 200);
  std::puts("cross thread steal: OK");
}

// ============================================================================
// Test 6: a value survives one decay step but not two
// ============================================================================
void test_decay_retention() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);
  Pool<int> pool([]{ return -1; }, {}, registry);
  pinner.set_worker(0);

  // One decay: served from the victim generation.
  pool.put(5);
  EXPECT_EQ(pool.current_size(), WORKERS);
  registry.decay_exclusive();
  EXPECT_EQ(pool.current_size(), std::size_t(0));
  EXPECT_EQ(pool.victim_size(), WORKERS);
  auto v = pool.get();
  EXPECT_EQ(*v, 5);
  EXPECT_EQ(pool.metrics().snapshot().victim_hits, 1u);

  // Two decays: gone.
  pool.put(9);
  registry.decay_exclusive();
  registry.decay_exclusive();
  EXPECT_EQ(pool.victim_size(), std::size_t(0));
  v = pool.get();
  EXPECT_EQ(*v, -1);
  std::puts("decay retention: OK");
}

// ============================================================================
// Test 7: victim chains are shared, victim private slots are not; an
// exhausted victim is dropped
// ============================================================================
void test_victim_scan() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);
  Pool<int> pool([]{ return -1; }, {}, registry);

  pinner.set_worker(2);
  pool.put(11); // private of worker 2
  pool.put(12); // chain of worker 2
  registry.decay_exclusive();

  pinner.set_worker(0);
  auto v = pool.get();
  EXPECT_EQ(*v, 12);
  EXPECT_EQ(pool.victim_size(), WORKERS);

  v = pool.get();
  EXPECT_EQ(*v, -1);
  EXPECT_EQ(pool.victim_size(), std::size_t(0)); // exhausted

  // Worker 2's private value went with it.
  pinner.set_worker(2);
  v = pool.get();
  EXPECT_EQ(*v, -1);
  std::puts("victim scan: OK");
}

// ============================================================================
// Test 8: registry bookkeeping follows the generations
// ============================================================================
void test_registration() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);
  pinner.set_worker(1);

  {
    Pool<int> pool({}, {}, registry);
    EXPECT_EQ(registry.current_pools(), std::size_t(0));
    pool.put(1);
    pool.put(2);
    EXPECT_EQ(registry.current_pools(), std::size_t(1)); // enrolled once

    registry.decay_exclusive();
    EXPECT_EQ(registry.current_pools(), std::size_t(0));
    EXPECT_EQ(registry.victim_pools(), std::size_t(1));

    pool.put(3); // new generation, enrolled again
    EXPECT_EQ(registry.current_pools(), std::size_t(1));
    EXPECT_EQ(registry.victim_pools(), std::size_t(1));
  }
  // Destroyed pools withdraw from both sets
  EXPECT_EQ(registry.current_pools(), std::size_t(0));
  EXPECT_EQ(registry.victim_pools(), std::size_t(0));

  // decay() goes through the pinner's stop-the-world window
  registry.decay();
  EXPECT_EQ(pinner.worlds(), 1);
  EXPECT_EQ(registry.decay_count(), 2u);
  std::puts("registration: OK");
}

// ============================================================================
// Test 9: the factory runs unpinned
// ============================================================================
void test_factory_unpinned() {
  ManualPinner pinner(WORKERS);
  Registry registry(pinner);
  int depth_seen = -1;
  Pool<int> pool([&]{ depth_seen = pinner.depth(); return 1; }, {}, registry);
  pinner.set_worker(3);
  auto v = pool.get();
  EXPECT_EQ(*v, 1);
  EXPECT_EQ(depth_seen, 0);
  std::puts("factory unpinned: OK");
}

// ============================================================================
// Test 10: a value whose move throws leaves no pin behind
// ============================================================================
struct Bomb {
  static inline bool armed = false;
  int v;
  explicit Bomb(int x) : v(x) {}
  Bomb(Bomb&& o) : v(o.v) {
    if (armed) throw std::runtime_error("move");
  }
  Bomb& operator=(Bomb&& o) { v = o.v; return *this; }
};

static bool put_throws(Pool<Bomb>& pool, int v) {
  Bomb::armed = true;
  bool threw = false;
  try { pool.put(Bomb(v)); } catch (const std::runtime_error&) { threw = true; }
  Bomb::armed = false;
  return threw;
}

void test_throwing_move() {
  {
    ManualPinner pinner(WORKERS);
    Registry registry(pinner);
    Pool<Bomb> pool({}, {}, registry);
    pinner.set_worker(0);

    // Private slot path
    EXPECT_TRUE(put_throws(pool, 1));
    EXPECT_EQ(pinner.depth(), 0);

    // Shared chain path
    pool.put(Bomb(2));
    EXPECT_TRUE(put_throws(pool, 3));
    EXPECT_EQ(pinner.depth(), 0);
    EXPECT_EQ(pool.metrics().snapshot().puts, 1u);

    auto v = pool.get();
    EXPECT_TRUE(v);
    EXPECT_EQ(v->v, 2);
    EXPECT_TRUE(!pool.get());
    EXPECT_EQ(pinner.depth(), 0);
  }

  {
    genpool::ThreadSlotPinner pinner(1);
    Registry registry(pinner);
    Pool<Bomb> pool({}, {}, registry);

    bool threw = false;
    std::thread t([&]{ threw = put_throws(pool, 4); });
    t.join();
    EXPECT_TRUE(threw);

    // The only slot was handed back, so the decay window still opens
    std::atomic<bool> decayed{false};
    std::thread d([&]{
      registry.decay();
      decayed.store(true);
    });
    for (int i = 0; i < 2000 && !decayed.load(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_TRUE(decayed.load());
    d.join();
    EXPECT_EQ(registry.decay_count(), 1u);
  }
  std::puts("throwing move: OK");
}

// ============================================================================
// Test 11: many threads, few worker slots, decay running alongside; no value
// is ever handed out twice
// ============================================================================
void test_stress(int per_thread = 20000) {
  constexpr int THREADS = 8;
  genpool::ThreadSlotPinner pinner(4);
  Registry registry(pinner);
  Pool<int> pool({}, genpool::PoolConfig{4, 256}, registry);

  const int N = THREADS * per_thread;
  std::vector<std::atomic<uint8_t>> handed(N);
  std::atomic<bool> start{false};
  std::atomic<int> finished{0};

  std::vector<std::thread> th;
  for (int t = 0; t < THREADS; ++t) {
    th.emplace_back([&, t]{
      while (!start.load(std::memory_order_acquire)) { /* spin */ }
      for (int i = 0; i < per_thread; ++i) {
        pool.put(t * per_thread + i);
        if (i % 2) {
          if (auto v = pool.get()) {
            EXPECT_EQ(int(handed[*v].fetch_add(1)), 0);
          }
        }
      }
      finished.fetch_add(1);
    });
  }

  std::thread decayer([&]{
    while (!start.load(std::memory_order_acquire)) { /* spin */ }
    while (finished.load() < THREADS) {
      registry.decay();
      std::this_thread::yield();
    }
  });

  start.store(true, std::memory_order_release);
  for (auto& x : th) x.join();
  decayer.join();

  // Drain what this thread can reach
  while (auto v = pool.get()) {
    EXPECT_EQ(int(handed[*v].fetch_add(1)), 0);
  }
  EXPECT_TRUE(registry.decay_count() > 0);
  std::puts("stress: OK");
}

int main() {
  std::puts("Running pool tests...");
#if defined(GENPOOL_RACE_DIAGNOSTICS)
  // put() drops values at random; only the no-duplicates property holds.
  test_stress();
  std::puts("All tests PASSED (race diagnostics build).");
  return 0;
#endif
  test_round_trip();
  test_no_factory();
  test_empty_values();
  test_cross_worker_steal();
  test_cross_thread_steal();
  test_decay_retention();
  test_victim_scan();
  test_registration();
  test_factory_unpinned();
  test_throwing_move();
  test_stress();
  std::puts("All tests PASSED.");
  return 0;
}
