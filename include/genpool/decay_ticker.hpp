// ============================================================================
// decay_ticker.hpp -- Periodic decay trigger
//
// Runs Registry::decay() on a background thread at a fixed interval. This is
// the timer flavour of the decay trigger; hosts with their own safepoints can
// call Registry::decay_exclusive() instead and skip the ticker entirely.
// ============================================================================
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>

#include "genpool/registry.hpp"

namespace genpool {

// ============================================================================
// `DecayTickerConfig` struct
// ============================================================================
struct DecayTickerConfig {
  uint32_t interval_ms { 100 };    // time between decay steps
  bool     verbose     { false };  // log each decay step to stdout
};

// ============================================================================
// `DecayTicker` class
// ============================================================================
class DecayTicker {
public:
  /// Constructor for the DecayTicker class.
  /// @param registry The registry to decay.
  /// @param cfg The ticker configuration.
  DecayTicker(Registry& registry, DecayTickerConfig cfg);
  ~DecayTicker();

  DecayTicker(const DecayTicker&) = delete;
  DecayTicker& operator=(const DecayTicker&) = delete;

  void start();
  void stop();

  struct Stats {
    std::atomic<uint64_t> ticks{0};
  };
  const Stats& stats() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace genpool
