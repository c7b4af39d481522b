#pragma once

#include "config/pool_config.hpp"
#include "core/types.hpp"

namespace dnmm {

// Stateful part of the fee: the confidence/inventory core decays toward its
// target instead of dropping at once.
struct FeeState {
    double      last_fee_bps = 0.0;
    BlockNumber last_block   = 0;
    bool        initialized  = false;
};

struct FeeContext {
    double      conf_bps          = 0.0;
    double      haircut_bps       = 0.0;   // soft divergence surcharge
    double      notional          = 0.0;   // trade size in quote units
    double      base_reserve      = 0.0;
    double      target_base       = 0.0;
    bool        is_base_in        = true;
    double      spread_bps        = 0.0;   // observed BBO spread
    double      sigma_bps         = 0.0;
    bool        aomq_active       = false;
    bool        allowlisted       = false;
    BlockNumber block             = 0;
};

struct FeeBreakdown {
    double   core_bps      = 0.0;
    double   haircut_bps   = 0.0;
    double   size_bps      = 0.0;
    double   tilt_bps      = 0.0;
    double   floor_bps     = 0.0;   // bbo floor in force, 0 when disabled
    double   lvr_bps       = 0.0;
    double   rebate_bps    = 0.0;   // discount actually granted
    double   total_bps     = 0.0;
    bool     floor_bound   = false; // floor lifted the running total
    bool     aomq_widened  = false;
    FeeState next_state;
};

class FeePipeline {
public:
    explicit FeePipeline(const PoolConfig& config);

    FeeBreakdown compute(const FeeContext& ctx, const FeeState& state) const;

    // base + alpha * conf + beta * inventory deviation, capped.
    double core_target_bps(double conf_bps, double inventory_dev_bps) const;
    double decayed_core_bps(double target_bps, const FeeState& state, BlockNumber block) const;
    double size_fee_bps(double u) const;
    double inventory_tilt_bps(const FeeContext& ctx) const;
    double bbo_floor_bps(double spread_bps) const;
    double volatility_surcharge_bps(double sigma_bps, bool aomq_active) const;

    static double inventory_deviation_bps(double base_reserve, double target_base);

private:
    FeeConfig       fee_;
    MakerConfig     maker_;
    InventoryConfig inventory_;
    AomqConfig      aomq_;
    double          rebate_bps_;
    FeatureFlags    flags_;
};

} // namespace dnmm
