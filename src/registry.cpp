// ============================================================================
// registry.cpp -- implementation of the Registry class
// ============================================================================
#include "genpool/registry.hpp"

#include <algorithm>
#include <stdexcept>

namespace genpool {

Registry::Registry(WorkerPinner& pinner) : pinner_(pinner) {
  if (pinner_.worker_count() == 0) {
    throw std::invalid_argument("pinner reports zero workers");
  }
}

Registry::~Registry() = default;

void Registry::enroll(PoolBase* pool) {
  pools_.push_back(pool);
}

void Registry::withdraw(PoolBase* pool) {
  std::lock_guard<std::mutex> lk(mtx_);
  pools_.erase(std::remove(pools_.begin(), pools_.end(), pool), pools_.end());
  old_pools_.erase(std::remove(old_pools_.begin(), old_pools_.end(), pool),
                   old_pools_.end());
}

void Registry::decay() {
  // Registration lock first, world second: the pool slow path takes them in
  // the same order.
  std::lock_guard<std::mutex> lk(mtx_);
  pinner_.stop_the_world([this] { decay_locked(); });
}

void Registry::decay_exclusive() {
  std::lock_guard<std::mutex> lk(mtx_);
  decay_locked();
}

void Registry::decay_locked() {
  // Victims untouched for a whole cycle go first.
  for (PoolBase* p : old_pools_) p->drop_victim();

  // Current generations become victims.
  for (PoolBase* p : pools_) p->demote_generation();

  // Pools with current generations now have victims and nobody has a
  // current generation.
  old_pools_.swap(pools_);
  pools_.clear();

  decays_.fetch_add(1, std::memory_order_relaxed);
}

std::size_t Registry::current_pools() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return pools_.size();
}

std::size_t Registry::victim_pools() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return old_pools_.size();
}

Registry& Registry::global() {
  static Registry registry(ThreadSlotPinner::global());
  return registry;
}

} // namespace genpool
