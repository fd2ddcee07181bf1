// ============================================================================
// config.cpp -- Configuration loading implementation
//
// This file implements the load_config function that reads configuration
// values from a TOML file and returns a Config struct.
// ============================================================================
#include "genpool/config.hpp"
#include <toml++/toml.hpp>
#include <cstdio>
#include <stdexcept>

namespace genpool {

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path) {
    Config cfg;

    try {
        auto tbl = toml::parse_file(config_path);

        // Pool config
        if (auto v = tbl["pool"]["INITIAL_SEGMENT"].value<uint32_t>()) cfg.INITIAL_SEGMENT = *v;
        if (auto v = tbl["pool"]["MAX_SEGMENT"].value<uint32_t>()) cfg.MAX_SEGMENT = *v;
        if (auto v = tbl["pool"]["MAX_WORKERS"].value<uint32_t>()) cfg.MAX_WORKERS = *v;

        // Decay config
        if (auto v = tbl["decay"]["DECAY_INTERVAL_MS"].value<uint32_t>()) cfg.DECAY_INTERVAL_MS = *v;
        if (auto v = tbl["decay"]["DECAY_VERBOSE"].value<bool>()) cfg.DECAY_VERBOSE = *v;

        // Benchmark config
        if (auto v = tbl["bench"]["BENCH_THREADS"].value<uint32_t>()) cfg.BENCH_THREADS = *v;
        if (auto v = tbl["bench"]["BENCH_SECONDS"].value<double>()) cfg.BENCH_SECONDS = *v;
        if (auto v = tbl["bench"]["PAYLOAD_BYTES"].value<std::size_t>()) cfg.PAYLOAD_BYTES = *v;
        if (auto v = tbl["bench"]["HOLD_PER_THREAD"].value<uint32_t>()) cfg.HOLD_PER_THREAD = *v;
        if (auto v = tbl["bench"]["PRINT_STATS"].value<bool>()) cfg.PRINT_STATS = *v;
        if (auto v = tbl["bench"]["OUTPUT_NPY"].value<std::string>()) cfg.OUTPUT_NPY = *v;

        std::printf("CONFIG: Loaded configuration from: %s\n", config_path.c_str());
    } catch (const toml::parse_error& err) {
        std::fprintf(stderr, "CONFIG: Error parsing config file '%s': %s\n",
                     config_path.c_str(), err.description().data());
        std::fprintf(stderr, "CONFIG: Using default configuration values.\n");
    } catch (const std::exception& err) {
        std::fprintf(stderr, "CONFIG: Error loading config file '%s': %s\n",
                     config_path.c_str(), err.what());
        std::fprintf(stderr, "CONFIG: Using default configuration values.\n");
    }

    return cfg;
}

} // namespace genpool
