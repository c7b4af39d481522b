#include "fees/fee_pipeline.hpp"

#include <algorithm>
#include <cmath>

namespace dnmm {

FeePipeline::FeePipeline(const PoolConfig& config)
    : fee_(config.fee),
      maker_(config.maker),
      inventory_(config.inventory),
      aomq_(config.aomq),
      rebate_bps_(config.rebates.rebate_bps),
      flags_(config.flags) {}

double FeePipeline::inventory_deviation_bps(double base_reserve, double target_base) {
    if (target_base <= 0.0) return 0.0;
    return std::abs(base_reserve - target_base) / target_base * kBps;
}

double FeePipeline::core_target_bps(double conf_bps, double inventory_dev_bps) const {
    double alpha = fee_.alpha_conf_num / fee_.alpha_conf_den;
    double beta = fee_.beta_inv_dev_num / fee_.beta_inv_dev_den;
    double fee = fee_.base_bps + alpha * conf_bps + beta * inventory_dev_bps;
    return std::min(fee, fee_.cap_bps);
}

double FeePipeline::decayed_core_bps(double target_bps, const FeeState& state, BlockNumber block) const {
    if (!state.initialized || fee_.decay_pct_per_block <= 0.0) return target_bps;
    if (state.last_fee_bps <= target_bps) return target_bps;

    // Fee jumps up immediately but relaxes geometrically toward a lower target.
    uint64_t blocks = block > state.last_block ? block - state.last_block : 0;
    double keep = std::pow(1.0 - fee_.decay_pct_per_block / 100.0, static_cast<double>(blocks));
    return target_bps + (state.last_fee_bps - target_bps) * keep;
}

double FeePipeline::size_fee_bps(double u) const {
    if (!flags_.enable_size_fee || u <= 0.0) return 0.0;
    double fee = fee_.size_lin_bps * u + fee_.size_quad_bps * u * u;
    return std::min(fee, fee_.size_fee_cap_bps);
}

double FeePipeline::inventory_tilt_bps(const FeeContext& ctx) const {
    if (!flags_.enable_inv_tilt || ctx.target_base <= 0.0) return 0.0;

    // Positive when the trade pushes inventory further from target.
    double dev_pct = (ctx.base_reserve - ctx.target_base) / ctx.target_base * 100.0;
    double direction = ctx.is_base_in ? 1.0 : -1.0;
    double raw = inventory_.inv_tilt_bps_per_1pct * dev_pct * direction;

    double spread_weight = 1.0 + inventory_.tilt_spread_weight_bps * ctx.spread_bps / kBps;
    double conf_weight = 1.0 + inventory_.tilt_conf_weight_bps * ctx.conf_bps / kBps;

    return std::clamp(raw * spread_weight * conf_weight,
                      -inventory_.inv_tilt_max_bps, inventory_.inv_tilt_max_bps);
}

double FeePipeline::bbo_floor_bps(double spread_bps) const {
    if (!flags_.enable_bbo_floor) return 0.0;
    return std::max(maker_.beta_floor_bps, maker_.alpha_bbo_bps * spread_bps / kBps);
}

double FeePipeline::volatility_surcharge_bps(double sigma_bps, bool aomq_active) const {
    if (!flags_.enable_lvr_fee) return 0.0;
    double ttl_sec = maker_.ttl_ms / 1000.0;
    double term = sigma_bps * std::sqrt(ttl_sec);
    if (aomq_active) term += aomq_.toxicity_bias_bps;
    return std::min(fee_.lvr_cap_bps, fee_.kappa_lvr_bps / kBps * term);
}

FeeBreakdown FeePipeline::compute(const FeeContext& ctx, const FeeState& state) const {
    FeeBreakdown b;

    double inv_dev = inventory_deviation_bps(ctx.base_reserve, ctx.target_base);
    double target = core_target_bps(ctx.conf_bps, inv_dev);
    b.core_bps = decayed_core_bps(target, state, ctx.block);
    b.next_state = FeeState{.last_fee_bps = b.core_bps, .last_block = ctx.block, .initialized = true};

    b.haircut_bps = ctx.haircut_bps;
    b.size_bps = size_fee_bps(ctx.notional / maker_.s0_notional);
    b.tilt_bps = inventory_tilt_bps(ctx);

    double total = std::max(0.0, b.core_bps + b.haircut_bps + b.size_bps + b.tilt_bps);

    b.floor_bps = bbo_floor_bps(ctx.spread_bps);
    if (total < b.floor_bps) {
        total = b.floor_bps;
        b.floor_bound = true;
    }

    b.lvr_bps = volatility_surcharge_bps(ctx.sigma_bps, ctx.aomq_active);
    total += b.lvr_bps;

    if (flags_.enable_aomq && ctx.aomq_active && total < aomq_.emergency_spread_bps) {
        total = aomq_.emergency_spread_bps;
        b.aomq_widened = true;
    }

    total = std::min(total, fee_.cap_bps);

    if (flags_.enable_rebates && ctx.allowlisted && rebate_bps_ > 0.0) {
        double discounted = std::min(std::max(total - rebate_bps_, b.floor_bps), fee_.cap_bps);
        b.rebate_bps = total - discounted;
        total = discounted;
    }

    b.total_bps = total;
    return b;
}

} // namespace dnmm
