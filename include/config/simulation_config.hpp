#pragma once

#include "config/pool_config.hpp"
#include "inventory/reserve_state.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace dnmm {

struct SimulationConfig {
    PoolConfig   pool;
    ReserveState reserves{.base_reserve = 1'000'000, .quote_reserve = 1'000'000,
                          .target_base = 1'000'000};

    size_t   steps                  = 10000;
    uint64_t seed                   = 42;
    uint64_t seconds_per_step       = 2;
    double   initial_mid            = 1.0;
    double   price_vol_bps          = 10.0;   // per-step stdev of the random walk
    double   spread_bps             = 6.0;    // primary bid/ask width
    double   secondary_noise_bps    = 5.0;
    double   stale_probability      = 0.02;   // primary reads as stale
    double   divergence_probability = 0.02;   // secondary jumps away
    double   divergence_jump_bps    = 60.0;
    double   swap_notional_mean     = 2000.0; // quote units
    double   base_in_probability    = 0.5;

    std::string report_path = "REPORT.md";
    std::string csv_path    = "data/simulation_results.csv";
};

} // namespace dnmm
