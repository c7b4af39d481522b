#include "preview/preview_snapshot.hpp"

namespace dnmm {

PreviewSnapshot make_snapshot(const PricingContext& ctx, uint32_t regime_flags,
                              BlockNumber block, Timestamp now) {
    return PreviewSnapshot{
        .mid            = ctx.mid,
        .divergence_bps = ctx.divergence_bps,
        .regime_flags   = regime_flags,
        .block          = block,
        .timestamp      = now,
        .conf_bps       = ctx.conf_bps,
        .spread_bps     = ctx.spread_bps,
        .sigma_bps      = ctx.sigma_bps,
        .secondary_conf_bps = ctx.secondary_conf_bps,
        .haircut_bps    = ctx.haircut_bps,
        .used_fallback  = ctx.used_fallback,
        .soft_active    = ctx.soft_active,
        .valid          = true,
    };
}

PricingContext to_context(const PreviewSnapshot& snapshot) {
    return PricingContext{
        .mid            = snapshot.mid,
        .conf_bps       = snapshot.conf_bps,
        .spread_bps     = snapshot.spread_bps,
        .sigma_bps      = snapshot.sigma_bps,
        .secondary_conf_bps = snapshot.secondary_conf_bps,
        .haircut_bps    = snapshot.haircut_bps,
        .divergence_bps = snapshot.divergence_bps,
        .used_fallback  = snapshot.used_fallback,
        .soft_active    = snapshot.soft_active,
    };
}

uint64_t snapshot_age_sec(const PreviewSnapshot& snapshot, Timestamp now) {
    return now > snapshot.timestamp ? now - snapshot.timestamp : 0;
}

Result<uint64_t> check_snapshot(const PreviewSnapshot& snapshot, const PreviewConfig& config,
                                Timestamp now) {
    if (!snapshot.valid || snapshot.mid <= 0.0) {
        return make_error(ErrorCode::MidUnset, "no preview snapshot persisted");
    }
    uint64_t age = snapshot_age_sec(snapshot, now);
    if (age > config.max_age_sec && config.revert_on_stale_preview) {
        return make_error(ErrorCode::PreviewSnapshotStale, "preview snapshot too old",
                          static_cast<double>(age), static_cast<double>(config.max_age_sec));
    }
    return age;
}

} // namespace dnmm
