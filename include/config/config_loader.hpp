#pragma once

#include "config/pool_config.hpp"
#include "config/simulation_config.hpp"
#include "core/result.hpp"

#include <string>

namespace dnmm {

// JSON config reader. Keys mirror the PoolConfig field names, grouped by
// section ("oracle", "fee", ...). Missing keys keep their defaults. Parse
// failures and out-of-range values fail with InvalidConfig.
Result<PoolConfig> parse_pool_config(const std::string& text);
Result<PoolConfig> load_pool_config(const std::string& path);

// Root object: {"pool": {...}, "reserves": {...}, "simulation": {...}}.
Result<SimulationConfig> parse_simulation_config(const std::string& text);
Result<SimulationConfig> load_simulation_config(const std::string& path);

} // namespace dnmm
