// ============================================================================
// `driver.cpp` -- Throughput driver for genpool
//
// Usage:
//   ./genpool-bench [run_seconds] [--config config.toml]
//
//  - Creates a Pool of heap buffers on a dedicated pinner/registry.
//  - Runs BENCH_THREADS workers that take HOLD_PER_THREAD buffers, touch
//    them, and hand them back, while a DecayTicker ages the pool.
//  - Runs for run_seconds (default from config, 2 s) and prints stats.
//  - Optionally writes per-thread cycle counts to OUTPUT_NPY (cnpy).
// ============================================================================
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <cnpy.h>

#include "genpool/config.hpp"
#include "genpool/decay_ticker.hpp"
#include "genpool/pinner.hpp"
#include "genpool/pool.hpp"
#include "genpool/registry.hpp"

using genpool::Config;
using genpool::DecayTicker;
using genpool::Pool;
using genpool::Registry;
using genpool::ThreadSlotPinner;

using Buffer = std::vector<std::byte>;

// ============================================================================
// Main
// ============================================================================
int main(int argc, char** argv) {
  double run_seconds = 0.0;
  std::string config_path;

  // Parse arguments: [run_seconds] [--config config.toml]
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::fprintf(stderr, "BENCH: Error: --config requires a file path\n");
        return 1;
      }
    } else if (run_seconds == 0.0) {
      double parsed = std::atof(arg.c_str());
      if (parsed > 0.0) {
        run_seconds = parsed;
      } else {
        std::fprintf(stderr,
          "BENCH: Error: Invalid run_seconds value: %s\n", arg.c_str());
        std::fprintf(stderr,
          "BENCH: Usage: %s [run_seconds] [--config config.toml]\n", argv[0]);
        return 1;
      }
    } else {
      std::fprintf(stderr, "BENCH: Error: Unknown argument: %s\n", arg.c_str());
      std::fprintf(stderr,
        "BENCH: Usage: %s [run_seconds] [--config config.toml]\n", argv[0]);
      return 1;
    }
  }

  // Default to configs/default.toml if no config specified and it exists
  if (config_path.empty()) {
    std::filesystem::path default_config = "configs/default.toml";
    if (std::filesystem::exists(default_config)) {
      config_path = default_config.string();
    }
  }

  Config cfg;
  if (!config_path.empty()) {
    cfg = genpool::load_config(config_path);
  } else {
    std::printf("BENCH: Using default configuration (no config file specified).\n");
  }
  if (run_seconds == 0.0) run_seconds = cfg.BENCH_SECONDS;

  try {
    // ========================================================================
    // Pool on its own pinner so MAX_WORKERS applies
    // ========================================================================
    ThreadSlotPinner pinner(cfg.MAX_WORKERS);
    Registry registry(pinner);

    const std::size_t payload = cfg.PAYLOAD_BYTES;
    Pool<std::unique_ptr<Buffer>> pool(
      [payload]{ return std::make_unique<Buffer>(payload); },
      cfg.pool_config(), registry);

    DecayTicker ticker(registry, cfg.ticker_config());

    std::printf("BENCH: threads=%u workers=%zu hold=%u payload=%zu B "
                "decay=%u ms run=%.2f s\n",
                cfg.BENCH_THREADS, pinner.worker_count(), cfg.HOLD_PER_THREAD,
                cfg.PAYLOAD_BYTES, cfg.DECAY_INTERVAL_MS, run_seconds);

    // ========================================================================
    // Workers
    // ========================================================================
    std::atomic<bool> start{false};
    std::atomic<bool> run{true};
    std::vector<uint64_t> cycles(cfg.BENCH_THREADS, 0);
    std::vector<std::thread> workers;
    workers.reserve(cfg.BENCH_THREADS);

    for (uint32_t t = 0; t < cfg.BENCH_THREADS; ++t) {
      workers.emplace_back([&, t]{
        std::vector<std::unique_ptr<Buffer>> held;
        held.reserve(cfg.HOLD_PER_THREAD);
        uint64_t n = 0;
        while (!start.load(std::memory_order_acquire)) { /* spin */ }
        while (run.load(std::memory_order_relaxed)) {
          for (uint32_t k = 0; k < cfg.HOLD_PER_THREAD; ++k) {
            auto b = pool.get();
            if (!b || !*b) continue;
            if (!(*b)->empty()) (**b)[0] = std::byte(n & 0xFF);
            held.push_back(std::move(*b));
          }
          for (auto& b : held) pool.put(std::move(b));
          held.clear();
          ++n;
        }
        cycles[t] = n;
      });
    }

    // ========================================================================
    // Run
    // ========================================================================
    ticker.start();
    auto t0 = std::chrono::steady_clock::now();
    start.store(true, std::memory_order_release);
    std::this_thread::sleep_for(std::chrono::duration<double>(run_seconds));
    run.store(false, std::memory_order_relaxed);
    for (auto& w : workers) w.join();
    auto t1 = std::chrono::steady_clock::now();
    ticker.stop();

    const double dt = std::chrono::duration<double>(t1 - t0).count();

    // ========================================================================
    // Report
    // ========================================================================
    uint64_t total = 0;
    for (auto c : cycles) total += c;
    const double ops = double(total) * cfg.HOLD_PER_THREAD * 2;
    std::printf("BENCH: %llu cycles in %.3f s -> %.2f Mops/s (get+put), "
                "%llu decay steps\n",
                (unsigned long long)total, dt, ops / dt / 1e6,
                (unsigned long long)ticker.stats().ticks.load());

    if (cfg.PRINT_STATS) {
      for (std::size_t t = 0; t < cycles.size(); ++t) {
        std::printf("BENCH: thread %zu cycles=%llu\n",
                    t, (unsigned long long)cycles[t]);
      }
      pool.metrics().print(stdout, "bench");
    }

    if (!cfg.OUTPUT_NPY.empty()) {
      cnpy::npy_save(cfg.OUTPUT_NPY, cycles.data(), {cycles.size()}, "w");
      std::printf("BENCH: Wrote per-thread cycles to %s\n", cfg.OUTPUT_NPY.c_str());
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "BENCH: Fatal: %s\n", e.what());
    return 1;
  }

  return 0;
}
