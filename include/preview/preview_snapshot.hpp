#pragma once

#include "config/pool_config.hpp"
#include "core/result.hpp"
#include "engine/quote_types.hpp"

#include <array>
#include <cstdint>

namespace dnmm {

struct PreviewSnapshot {
    double      mid            = 0.0;
    double      divergence_bps = 0.0;
    uint32_t    regime_flags   = 0;
    BlockNumber block          = 0;
    Timestamp   timestamp      = 0;

    // Replay inputs.
    double      conf_bps       = 0.0;
    double      spread_bps     = 0.0;
    double      sigma_bps      = 0.0;
    double      secondary_conf_bps = 0.0;
    double      haircut_bps    = 0.0;
    bool        used_fallback  = false;
    bool        soft_active    = false;

    bool        valid          = false;
};

constexpr std::array<uint32_t, 4> kLadderMultipliers = {1, 2, 5, 10};

PreviewSnapshot make_snapshot(const PricingContext& ctx, uint32_t regime_flags,
                              BlockNumber block, Timestamp now);

PricingContext to_context(const PreviewSnapshot& snapshot);

uint64_t snapshot_age_sec(const PreviewSnapshot& snapshot, Timestamp now);

// Age of a usable snapshot. Fails with MidUnset when nothing was persisted
// yet, and with PreviewSnapshotStale past max age when strict mode is on.
Result<uint64_t> check_snapshot(const PreviewSnapshot& snapshot, const PreviewConfig& config,
                                Timestamp now);

} // namespace dnmm
