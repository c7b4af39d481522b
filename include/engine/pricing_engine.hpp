#pragma once

#include "aomq/degraded_quote_mode.hpp"
#include "config/pool_config.hpp"
#include "core/result.hpp"
#include "engine/event_log.hpp"
#include "engine/quote_types.hpp"
#include "fees/fee_pipeline.hpp"
#include "inventory/inventory_solver.hpp"
#include "inventory/recenter.hpp"
#include "inventory/reserve_state.hpp"
#include "oracle/divergence_gate.hpp"
#include "oracle/oracle_feed.hpp"
#include "oracle/oracle_fusion.hpp"
#include "oracle/sigma_tracker.hpp"
#include "preview/preview_snapshot.hpp"

#include <string>
#include <vector>

namespace dnmm {

// All mutable state of one pool. Swaps build a copy, then commit it whole.
struct EngineState {
    ReserveState        reserves;
    SoftDivergenceState soft_divergence;
    AomqActivationState aomq;
    RecenterState       recenter;
    FeeState            fee;
    SigmaState          sigma;
    PreviewSnapshot     snapshot;
};

class PricingEngine {
public:
    // Throws std::invalid_argument if config does not validate.
    PricingEngine(PoolConfig config, ReserveState reserves, const IOracleFeed& feed);

    void set_current_time(Timestamp ts) { now_ = ts; }
    void set_block(BlockNumber block) { block_ = block; }

    // Governance hook. The new config is adopted only if it validates.
    Result<void> apply_config(const PoolConfig& config);

    Result<QuoteResult> quote(Amount amount_in, bool is_base_in, OracleMode mode,
                              const std::string& caller = {}) const;

    Result<SwapResult> swap(Amount amount_in, Amount min_amount_out, bool is_base_in,
                            OracleMode mode, Timestamp deadline, const std::string& caller = {});

    // Fees a live trade of each size (base units) would pay, replayed on the
    // last snapshot. Never mutates.
    Result<FeePreview> preview_fees(const std::vector<Amount>& sizes) const;
    Result<PreviewLadder> preview_ladder(Amount base_size = 0) const;

    Result<void> refresh_preview_snapshot(OracleMode mode);

    // Permissionless. Needs a fresh primary reading.
    Result<void> manual_rebalance();

    const SoftDivergenceState& soft_divergence_state() const { return state_.soft_divergence; }
    const PreviewSnapshot& preview_snapshot_raw() const { return state_.snapshot; }
    const ReserveState& reserves() const { return state_.reserves; }
    const AomqActivationState& aomq_state() const { return state_.aomq; }
    const RecenterState& recenter_state() const { return state_.recenter; }
    const FeeState& fee_state() const { return state_.fee; }
    double sigma_bps() const { return SigmaTracker::sigma_bps(state_.sigma); }
    const EventLog& events() const { return events_; }
    const PoolConfig& config() const { return config_; }
    Timestamp current_time() const { return now_; }
    BlockNumber current_block() const { return block_; }

private:
    struct LiveRead {
        PricingContext      ctx;
        SoftDivergenceState next_soft;
        SigmaState          next_sigma;
        DivergenceBand      band = DivergenceBand::NoSignal;
    };

    struct TradePlan {
        QuoteResult quote;
        FeeState    next_fee;
    };

    struct SidePreview {
        double fee_bps = 0.0;
        bool   clamped = false;
    };

    Result<LiveRead> read_live(OracleMode mode) const;
    Result<TradePlan> plan_trade(const PricingContext& ctx, Amount amount_in, bool is_base_in,
                                 bool allowlisted) const;
    FeeBreakdown fee_for(const PricingContext& ctx, double notional, bool is_base_in,
                         bool side_active, bool allowlisted) const;
    SidePreview preview_side(const PricingContext& ctx, const AomqActivationState& aomq,
                             Amount base_size, bool is_base_in) const;
    uint32_t snapshot_flags(const PricingContext& ctx, const AomqActivationState& aomq) const;
    ReserveFloors floors_for(double mid) const;
    bool is_allowlisted(const std::string& caller) const;
    void rebuild_components();

    PoolConfig         config_;
    const IOracleFeed& feed_;

    OracleFusion      fusion_;
    DivergenceGate    gate_;
    SigmaTracker      sigma_;
    FeePipeline       fees_;
    DegradedQuoteMode aomq_;
    Recenter          recenter_;

    EngineState state_;
    EventLog    events_;
    Timestamp   now_   = 0;
    BlockNumber block_ = 0;
};

} // namespace dnmm
