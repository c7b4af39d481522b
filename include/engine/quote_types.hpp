#pragma once

#include "aomq/degraded_quote_mode.hpp"
#include "core/types.hpp"
#include "fees/fee_pipeline.hpp"
#include "inventory/recenter.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace dnmm {

// Everything the fee pipeline needs besides reserves and fee state. Built
// from live oracles for quotes and swaps, or from the preview snapshot.
struct PricingContext {
    double mid            = 0.0;
    double conf_bps       = 0.0;
    double spread_bps     = 0.0;
    double sigma_bps      = 0.0;
    double secondary_conf_bps = 0.0;
    double haircut_bps    = 0.0;
    double divergence_bps = 0.0;
    bool   used_fallback  = false;
    bool   soft_active    = false;
};

enum class QuoteReason : uint8_t { Normal, SoftDivergence, Fallback, FloorClamp, AomqClamp };

const char* to_string(QuoteReason reason);

struct QuoteResult {
    Amount              amount_out     = 0;
    Amount              requested_in   = 0;
    Amount              applied_in     = 0;
    Amount              leftover_in    = 0;
    double              fee_bps        = 0.0;
    double              mid            = 0.0;
    double              divergence_bps = 0.0;
    bool                used_fallback  = false;
    bool                is_partial     = false;
    QuoteReason         reason         = QuoteReason::Normal;
    uint32_t            regime_flags   = 0;
    FeeBreakdown        fee;
    AomqActivationState aomq;
};

struct SwapResult {
    QuoteResult                    fill;
    std::optional<RebalanceRecord> rebalance;   // set when the trade recentered
};

struct FeePreview {
    std::vector<double> ask_fee_bps;   // trader buys base (quote in)
    std::vector<double> bid_fee_bps;   // trader sells base (base in)
    uint64_t            snapshot_age_sec = 0;
};

struct PreviewLadder {
    std::vector<Amount> sizes;        // base units
    std::vector<double> ask_fee_bps;
    std::vector<double> bid_fee_bps;
    std::vector<bool>   ask_clamped;
    std::vector<bool>   bid_clamped;
    uint64_t            snapshot_age_sec   = 0;
    Timestamp           snapshot_timestamp = 0;
    double              snapshot_mid       = 0.0;
};

} // namespace dnmm
