#include "config/pool_config.hpp"

#include <cmath>

namespace dnmm {

namespace {

Error invalid(const std::string& field, double value) {
    return make_error(ErrorCode::InvalidConfig, field, value);
}

bool non_negative(double v) { return std::isfinite(v) && v >= 0.0; }

} // anonymous namespace

Result<void> validate_config(const PoolConfig& c) {
    const auto& o = c.oracle;
    if (!(o.max_age_sec > 0.0))                    return invalid("oracle.max_age_sec", o.max_age_sec);
    if (!(o.secondary_max_age_sec > 0.0))          return invalid("oracle.secondary_max_age_sec", o.secondary_max_age_sec);
    if (!(o.secondary_max_age_sec_strict > 0.0))   return invalid("oracle.secondary_max_age_sec_strict", o.secondary_max_age_sec_strict);
    if (!non_negative(o.conf_cap_bps_spot))        return invalid("oracle.conf_cap_bps_spot", o.conf_cap_bps_spot);
    if (!non_negative(o.conf_cap_bps_strict))      return invalid("oracle.conf_cap_bps_strict", o.conf_cap_bps_strict);
    if (!non_negative(o.conf_weight_spread_bps))   return invalid("oracle.conf_weight_spread_bps", o.conf_weight_spread_bps);
    if (!non_negative(o.conf_weight_sigma_bps))    return invalid("oracle.conf_weight_sigma_bps", o.conf_weight_sigma_bps);
    if (!non_negative(o.conf_weight_secondary_bps)) return invalid("oracle.conf_weight_secondary_bps", o.conf_weight_secondary_bps);
    if (!(o.sigma_ewma_lambda_bps >= 0.0 && o.sigma_ewma_lambda_bps < kBps))
        return invalid("oracle.sigma_ewma_lambda_bps", o.sigma_ewma_lambda_bps);

    const auto& d = c.divergence;
    if (!non_negative(d.divergence_bps))           return invalid("divergence.divergence_bps", d.divergence_bps);
    if (!non_negative(d.accept_bps))               return invalid("divergence.accept_bps", d.accept_bps);
    if (!(d.soft_bps >= d.accept_bps))             return invalid("divergence.soft_bps", d.soft_bps);
    if (!(d.hard_bps >= d.soft_bps))               return invalid("divergence.hard_bps", d.hard_bps);
    if (!non_negative(d.haircut_min_bps))          return invalid("divergence.haircut_min_bps", d.haircut_min_bps);
    if (!non_negative(d.haircut_slope_bps))        return invalid("divergence.haircut_slope_bps", d.haircut_slope_bps);
    if (d.healthy_frames == 0)                     return invalid("divergence.healthy_frames", 0.0);

    const auto& f = c.fee;
    if (!(f.cap_bps > 0.0 && f.cap_bps < kBps))    return invalid("fee.cap_bps", f.cap_bps);
    if (!(f.base_bps >= 0.0 && f.base_bps <= f.cap_bps)) return invalid("fee.base_bps", f.base_bps);
    if (!non_negative(f.alpha_conf_num))           return invalid("fee.alpha_conf_num", f.alpha_conf_num);
    if (!(f.alpha_conf_den > 0.0))                 return invalid("fee.alpha_conf_den", f.alpha_conf_den);
    if (!non_negative(f.beta_inv_dev_num))         return invalid("fee.beta_inv_dev_num", f.beta_inv_dev_num);
    if (!(f.beta_inv_dev_den > 0.0))               return invalid("fee.beta_inv_dev_den", f.beta_inv_dev_den);
    if (!(f.decay_pct_per_block >= 0.0 && f.decay_pct_per_block <= 100.0))
        return invalid("fee.decay_pct_per_block", f.decay_pct_per_block);
    if (!non_negative(f.size_lin_bps))             return invalid("fee.size_lin_bps", f.size_lin_bps);
    if (!non_negative(f.size_quad_bps))            return invalid("fee.size_quad_bps", f.size_quad_bps);
    if (!non_negative(f.size_fee_cap_bps))         return invalid("fee.size_fee_cap_bps", f.size_fee_cap_bps);
    if (!non_negative(f.kappa_lvr_bps))            return invalid("fee.kappa_lvr_bps", f.kappa_lvr_bps);
    if (!non_negative(f.lvr_cap_bps))              return invalid("fee.lvr_cap_bps", f.lvr_cap_bps);

    const auto& m = c.maker;
    if (!(m.s0_notional > 0.0))                    return invalid("maker.s0_notional", m.s0_notional);
    if (!non_negative(m.ttl_ms))                   return invalid("maker.ttl_ms", m.ttl_ms);
    if (!non_negative(m.alpha_bbo_bps))            return invalid("maker.alpha_bbo_bps", m.alpha_bbo_bps);
    if (!(m.beta_floor_bps >= 0.0 && m.beta_floor_bps <= f.cap_bps))
        return invalid("maker.beta_floor_bps", m.beta_floor_bps);

    const auto& i = c.inventory;
    if (!(i.floor_bps >= 0.0 && i.floor_bps < kBps)) return invalid("inventory.floor_bps", i.floor_bps);
    if (!non_negative(i.recenter_threshold_bps))   return invalid("inventory.recenter_threshold_bps", i.recenter_threshold_bps);
    if (!non_negative(i.recenter_min_change_bps))  return invalid("inventory.recenter_min_change_bps", i.recenter_min_change_bps);
    if (!non_negative(i.inv_tilt_bps_per_1pct))    return invalid("inventory.inv_tilt_bps_per_1pct", i.inv_tilt_bps_per_1pct);
    if (!non_negative(i.inv_tilt_max_bps))         return invalid("inventory.inv_tilt_max_bps", i.inv_tilt_max_bps);
    if (!non_negative(i.tilt_conf_weight_bps))     return invalid("inventory.tilt_conf_weight_bps", i.tilt_conf_weight_bps);
    if (!non_negative(i.tilt_spread_weight_bps))   return invalid("inventory.tilt_spread_weight_bps", i.tilt_spread_weight_bps);

    const auto& a = c.aomq;
    if (c.flags.enable_aomq && !(a.min_quote_notional > 0.0))
        return invalid("aomq.min_quote_notional", a.min_quote_notional);
    if (!(a.emergency_spread_bps >= 0.0 && a.emergency_spread_bps <= f.cap_bps))
        return invalid("aomq.emergency_spread_bps", a.emergency_spread_bps);
    if (!(a.floor_epsilon_bps >= 0.0 && a.floor_epsilon_bps <= kBps))
        return invalid("aomq.floor_epsilon_bps", a.floor_epsilon_bps);
    if (!non_negative(a.toxicity_bias_bps))        return invalid("aomq.toxicity_bias_bps", a.toxicity_bias_bps);

    if (c.preview.max_age_sec == 0)                return invalid("preview.max_age_sec", 0.0);

    if (!(c.rebates.rebate_bps >= 0.0 && c.rebates.rebate_bps <= f.cap_bps))
        return invalid("rebates.rebate_bps", c.rebates.rebate_bps);

    return {};
}

} // namespace dnmm
