#pragma once

#include "config/simulation_config.hpp"
#include "engine/pricing_engine.hpp"
#include "oracle/sim_oracle_feed.hpp"
#include "sim/simulation_metrics.hpp"

#include <string>

namespace dnmm {

// Drives one engine with a seeded random-walk oracle and random swaps.
class SimulationRunner {
public:
    explicit SimulationRunner(const SimulationConfig& config);

    void run();

    const SimulationMetrics& metrics() const { return metrics_; }
    const PricingEngine& engine() const { return engine_; }

    std::string report() const;
    void write_report(const std::string& report_path) const;
    void write_csv(const std::string& csv_path) const;

private:
    SimulationConfig  config_;
    SimOracleFeed     feed_;
    PricingEngine     engine_;
    SimulationMetrics metrics_;
};

} // namespace dnmm
