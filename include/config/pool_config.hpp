#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dnmm {

struct OracleConfig {
    double   max_age_sec                  = 30.0;   // primary and EMA freshness bound
    double   secondary_max_age_sec        = 60.0;
    double   secondary_max_age_sec_strict = 20.0;
    bool     allow_ema_fallback           = true;
    double   conf_cap_bps_spot            = 250.0;
    double   conf_cap_bps_strict          = 150.0;
    double   conf_weight_spread_bps       = 20.0;   // relative blend weights
    double   conf_weight_sigma_bps        = 10.0;
    double   conf_weight_secondary_bps    = 30.0;
    double   sigma_ewma_lambda_bps        = 5000.0; // weight kept on previous variance
};

struct DivergenceConfig {
    double   divergence_bps    = 80.0;   // single gate when soft divergence is off
    double   accept_bps        = 35.0;
    double   soft_bps          = 50.0;
    double   hard_bps          = 85.0;
    double   haircut_min_bps   = 5.0;
    double   haircut_slope_bps = 1.0;    // haircut bps per bps above accept
    uint32_t healthy_frames    = 3;      // sub-accept frames needed to clear
};

struct FeeConfig {
    double   base_bps             = 10.0;
    double   alpha_conf_num       = 1.0;
    double   alpha_conf_den       = 2.0;
    double   beta_inv_dev_num     = 0.0;
    double   beta_inv_dev_den     = 1.0;
    double   cap_bps              = 200.0;  // global cap
    double   decay_pct_per_block  = 0.0;
    double   size_lin_bps         = 12.0;
    double   size_quad_bps        = 3.0;
    double   size_fee_cap_bps     = 80.0;
    double   kappa_lvr_bps        = 0.0;    // volatility surcharge slope
    double   lvr_cap_bps          = 50.0;
};

struct MakerConfig {
    double   s0_notional     = 5000.0;  // reference notional in quote units
    double   ttl_ms          = 3000.0;
    double   alpha_bbo_bps   = 5000.0;  // share of the observed spread, 10000 = 100%
    double   beta_floor_bps  = 10.0;
};

struct InventoryConfig {
    Amount   base_floor                   = 0;
    Amount   quote_floor                  = 0;
    double   floor_bps                    = 0.0;    // per-side floor as a share of target base
    double   recenter_threshold_bps       = 500.0;  // mid move that triggers a recenter
    double   recenter_min_change_bps      = 10.0;   // smallest target change worth committing
    uint64_t recenter_cooldown_sec        = 120;
    uint32_t recenter_healthy_frames      = 3;
    double   inv_tilt_bps_per_1pct        = 8.0;
    double   inv_tilt_max_bps             = 40.0;
    double   tilt_conf_weight_bps         = 20.0;
    double   tilt_spread_weight_bps       = 20.0;
};

struct AomqConfig {
    double   min_quote_notional   = 500.0;  // quote units
    double   emergency_spread_bps = 50.0;
    double   floor_epsilon_bps    = 100.0;
    double   toxicity_bias_bps    = 0.0;    // extra sigma bps while degraded
};

struct PreviewConfig {
    uint64_t max_age_sec              = 10;
    uint64_t snapshot_cooldown_sec    = 0;
    bool     revert_on_stale_preview  = true;
};

struct RebateConfig {
    double                   rebate_bps = 3.0;
    std::vector<std::string> allowlist;
};

struct FeatureFlags {
    bool enable_soft_divergence = true;
    bool enable_size_fee        = true;
    bool enable_bbo_floor       = true;
    bool enable_inv_tilt        = true;
    bool enable_aomq            = true;
    bool enable_rebates         = false;
    bool enable_auto_recenter   = true;
    bool enable_lvr_fee         = false;
};

struct PoolConfig {
    OracleConfig     oracle;
    DivergenceConfig divergence;
    FeeConfig        fee;
    MakerConfig      maker;
    InventoryConfig  inventory;
    AomqConfig       aomq;
    PreviewConfig    preview;
    RebateConfig     rebates;
    FeatureFlags     flags;
};

// Reports the first out-of-range parameter as InvalidConfig.
Result<void> validate_config(const PoolConfig& config);

} // namespace dnmm
