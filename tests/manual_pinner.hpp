// ============================================================================
// manual_pinner.hpp -- test pinner with an explicitly chosen worker index
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <functional>

#include "genpool/pinner.hpp"

// Each thread picks its worker index with set_worker(); pin() just returns
// it. Lets tests play several workers from one thread.
class ManualPinner final : public genpool::WorkerPinner {
public:
  explicit ManualPinner(std::size_t workers) : workers_(workers) {}

  void set_worker(std::size_t pid) { tls_worker() = pid; }

  std::size_t pin() override {
    depth_.fetch_add(1, std::memory_order_relaxed);
    pins_.fetch_add(1, std::memory_order_relaxed);
    return tls_worker();
  }
  void unpin() override {
    depth_.fetch_sub(1, std::memory_order_relaxed);
  }
  std::size_t worker_count() const noexcept override { return workers_; }
  std::size_t pin_depth() const override { return std::size_t(depth()); }
  void stop_the_world(const std::function<void()>& fn) override {
    worlds_.fetch_add(1, std::memory_order_relaxed);
    fn();
  }

  int depth() const { return depth_.load(std::memory_order_relaxed); }
  long pins() const { return pins_.load(std::memory_order_relaxed); }
  long worlds() const { return worlds_.load(std::memory_order_relaxed); }

private:
  static std::size_t& tls_worker() {
    thread_local std::size_t pid = 0;
    return pid;
  }

  const std::size_t  workers_;
  std::atomic<int>   depth_{0};
  std::atomic<long>  pins_{0};
  std::atomic<long>  worlds_{0};
};
