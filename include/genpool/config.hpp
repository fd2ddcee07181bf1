// ============================================================================
// config.hpp -- Configuration structure for genpool
//
// This header defines the Config struct that holds all tunables for pools,
// the decay ticker and the benchmark driver, which can be loaded from a TOML
// configuration file.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "genpool/decay_ticker.hpp"
#include "genpool/pool.hpp"

namespace genpool {

// ============================================================================
// Configuration structure
// ============================================================================
struct Config {
    // ========================================================================
    // Pool chain sizing. Both must be powers of two.
    // ========================================================================
    uint32_t INITIAL_SEGMENT  { 8 };
    uint32_t MAX_SEGMENT      { kSegmentLimit };
    uint32_t MAX_WORKERS      { 0 };       // 0 => hardware_concurrency()

    // ========================================================================
    // Decay ticker
    // ========================================================================
    uint32_t DECAY_INTERVAL_MS { 100 };
    bool     DECAY_VERBOSE     { false };

    // ========================================================================
    // Benchmark driver
    // ========================================================================
    uint32_t    BENCH_THREADS   { 4 };
    double      BENCH_SECONDS   { 2.0 };
    std::size_t PAYLOAD_BYTES   { 256 };   // size of each pooled buffer
    uint32_t    HOLD_PER_THREAD { 4 };     // buffers held before returning
    bool        PRINT_STATS     { true };
    std::string OUTPUT_NPY      { "" };    // per-thread op counts; empty = off

    // ========================================================================
    // Derived component configs
    // ========================================================================
    PoolConfig pool_config() const {
        PoolConfig c;
        c.initial_segment = INITIAL_SEGMENT;
        c.max_segment     = MAX_SEGMENT;
        return c;
    }
    DecayTickerConfig ticker_config() const {
        DecayTickerConfig c;
        c.interval_ms = DECAY_INTERVAL_MS;
        c.verbose     = DECAY_VERBOSE;
        return c;
    }
};

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path);

} // namespace genpool
