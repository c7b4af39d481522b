#include "engine/pricing_engine.hpp"
#include "inventory/inventory_solver.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace dnmm {

const char* to_string(QuoteReason reason) {
    switch (reason) {
        case QuoteReason::Normal:         return "normal";
        case QuoteReason::SoftDivergence: return "soft_divergence";
        case QuoteReason::Fallback:       return "fallback";
        case QuoteReason::FloorClamp:     return "floor_clamp";
        case QuoteReason::AomqClamp:      return "aomq_clamp";
    }
    return "unknown";
}

PricingEngine::PricingEngine(PoolConfig config, ReserveState reserves, const IOracleFeed& feed)
    : config_(std::move(config)),
      feed_(feed),
      fusion_(config_.oracle, feed_),
      gate_(config_.divergence, config_.flags.enable_soft_divergence),
      sigma_(config_.oracle.sigma_ewma_lambda_bps),
      fees_(config_),
      aomq_(config_.aomq, config_.fee.cap_bps, config_.flags.enable_aomq),
      recenter_(config_.inventory, config_.flags.enable_auto_recenter) {
    auto valid = validate_config(config_);
    if (!valid) {
        throw std::invalid_argument("invalid pool config: " + valid.error().detail);
    }
    state_.reserves = reserves;
    state_.recenter = recenter_.initial_state();
}

void PricingEngine::rebuild_components() {
    fusion_ = OracleFusion(config_.oracle, feed_);
    gate_ = DivergenceGate(config_.divergence, config_.flags.enable_soft_divergence);
    sigma_ = SigmaTracker(config_.oracle.sigma_ewma_lambda_bps);
    fees_ = FeePipeline(config_);
    aomq_ = DegradedQuoteMode(config_.aomq, config_.fee.cap_bps, config_.flags.enable_aomq);
    recenter_ = Recenter(config_.inventory, config_.flags.enable_auto_recenter);
}

Result<void> PricingEngine::apply_config(const PoolConfig& config) {
    auto valid = validate_config(config);
    if (!valid) return valid.error();

    config_ = config;
    rebuild_components();
    return {};
}

ReserveFloors PricingEngine::floors_for(double mid) const {
    return reserve_floors(config_.inventory, state_.reserves, mid);
}

bool PricingEngine::is_allowlisted(const std::string& caller) const {
    if (caller.empty()) return false;
    const auto& list = config_.rebates.allowlist;
    return std::find(list.begin(), list.end(), caller) != list.end();
}

Result<PricingEngine::LiveRead> PricingEngine::read_live(OracleMode mode) const {
    auto ref = fusion_.read_reference_price(mode, SigmaTracker::sigma_bps(state_.sigma));
    if (!ref) return ref.error();

    LiveRead live;
    live.next_sigma = sigma_.observe(state_.sigma, ref->mid, block_);

    // Divergence needs two independent mids: the primary and a fresh secondary.
    DivergenceOutcome div = gate_.no_signal(state_.soft_divergence);
    if (!ref->used_fallback && ref->secondary) {
        auto eval = gate_.evaluate(ref->mid, ref->secondary->mid, state_.soft_divergence);
        if (!eval) return eval.error();
        div = *eval;
    }
    live.next_soft = div.next;
    live.band = div.band;

    ConfidenceInputs in = ref->conf_inputs;
    in.sigma_bps = SigmaTracker::sigma_bps(live.next_sigma);

    live.ctx = PricingContext{
        .mid                = ref->mid,
        .conf_bps           = fusion_.blend_confidence(in, mode),
        .spread_bps         = ref->spread_bps,
        .sigma_bps          = in.sigma_bps,
        .secondary_conf_bps = ref->secondary_conf_bps,
        .haircut_bps        = div.haircut_bps,
        .divergence_bps     = div.delta_bps,
        .used_fallback      = ref->used_fallback,
        .soft_active        = div.next.active,
    };
    return live;
}

FeeBreakdown PricingEngine::fee_for(const PricingContext& ctx, double notional, bool is_base_in,
                                    bool side_active, bool allowlisted) const {
    FeeContext fctx{
        .conf_bps     = ctx.conf_bps,
        .haircut_bps  = ctx.haircut_bps,
        .notional     = notional,
        .base_reserve = static_cast<double>(state_.reserves.base_reserve),
        .target_base  = static_cast<double>(state_.reserves.target_base),
        .is_base_in   = is_base_in,
        .spread_bps   = ctx.spread_bps,
        .sigma_bps    = ctx.sigma_bps,
        .aomq_active  = side_active,
        .allowlisted  = allowlisted,
        .block        = block_,
    };
    return fees_.compute(fctx, state_.fee);
}

Result<PricingEngine::TradePlan> PricingEngine::plan_trade(const PricingContext& ctx,
                                                           Amount amount_in, bool is_base_in,
                                                           bool allowlisted) const {
    if (amount_in == 0) {
        return make_error(ErrorCode::ZeroAmount, "amount_in is zero");
    }

    const ReserveState& reserves = state_.reserves;
    ReserveFloors floors = floors_for(ctx.mid);
    AomqActivationState aomq = aomq_.evaluate(ctx.soft_active, reserves, floors, ctx.used_fallback);
    bool side_active = aomq.active_for(is_base_in);

    SizeClamp clamp = aomq_.clamp_size(amount_in, is_base_in, ctx.mid, aomq);
    if (clamp.amount_in == 0) {
        return make_error(ErrorCode::ZeroAmount, "degraded size clamp left nothing to fill",
                          static_cast<double>(amount_in));
    }

    double notional = is_base_in ? static_cast<double>(clamp.amount_in) * ctx.mid
                                 : static_cast<double>(clamp.amount_in);
    FeeBreakdown fee = fee_for(ctx, notional, is_base_in, side_active, allowlisted);

    Amount floor = floors.paying(is_base_in);
    auto fill = solve_fill(clamp.amount_in, is_base_in, reserves, floor, ctx.mid, fee.total_bps);
    if (!fill) return fill.error();

    TradePlan plan;
    plan.next_fee = fee.next_state;

    QuoteResult& q = plan.quote;
    q.amount_out = fill->amount_out;
    q.requested_in = amount_in;
    q.applied_in = fill->applied_in;
    q.leftover_in = amount_in - fill->applied_in;
    q.fee_bps = fee.total_bps;
    q.mid = ctx.mid;
    q.divergence_bps = ctx.divergence_bps;
    q.used_fallback = ctx.used_fallback;
    q.is_partial = q.leftover_in > 0;
    q.fee = fee;
    q.aomq = aomq;

    if (clamp.clamped) {
        q.reason = QuoteReason::AomqClamp;
    } else if (fill->is_partial) {
        q.reason = QuoteReason::FloorClamp;
    } else if (ctx.soft_active || ctx.haircut_bps > 0.0) {
        q.reason = QuoteReason::SoftDivergence;
    } else if (ctx.used_fallback) {
        q.reason = QuoteReason::Fallback;
    }

    uint32_t flags = 0;
    if (side_active) flags |= kRegimeAomq;
    if (ctx.used_fallback) flags |= kRegimeFallback;
    if (aomq_.near_floor(reserves.paying_reserve(is_base_in), floor)) flags |= kRegimeNearFloor;
    if (fee.size_bps > 0.0) flags |= kRegimeSizeFee;
    if (fee.tilt_bps != 0.0) flags |= kRegimeInvTilt;
    if (ctx.soft_active) flags |= kRegimeSoftDivergence;
    q.regime_flags = flags;

    return plan;
}

Result<QuoteResult> PricingEngine::quote(Amount amount_in, bool is_base_in, OracleMode mode,
                                         const std::string& caller) const {
    auto live = read_live(mode);
    if (!live) return live.error();

    auto plan = plan_trade(live->ctx, amount_in, is_base_in, is_allowlisted(caller));
    if (!plan) return plan.error();
    return plan->quote;
}

Result<SwapResult> PricingEngine::swap(Amount amount_in, Amount min_amount_out, bool is_base_in,
                                       OracleMode mode, Timestamp deadline,
                                       const std::string& caller) {
    if (now_ > deadline) {
        return make_error(ErrorCode::DeadlineExpired, "swap deadline passed",
                          static_cast<double>(now_), static_cast<double>(deadline));
    }

    auto live = read_live(mode);
    if (!live) return live.error();

    auto plan = plan_trade(live->ctx, amount_in, is_base_in, is_allowlisted(caller));
    if (!plan) return plan.error();

    const QuoteResult& q = plan->quote;
    if (q.amount_out < min_amount_out) {
        return make_error(ErrorCode::SlippageExceeded, "amount_out below minimum",
                          static_cast<double>(q.amount_out), static_cast<double>(min_amount_out));
    }

    // Stage everything, then commit in one assignment.
    EngineState next = state_;
    if (is_base_in) {
        next.reserves.base_reserve += q.applied_in;
        next.reserves.quote_reserve -= q.amount_out;
    } else {
        next.reserves.quote_reserve += q.applied_in;
        next.reserves.base_reserve -= q.amount_out;
    }
    next.soft_divergence = live->next_soft;
    next.sigma = live->next_sigma;
    next.fee = plan->next_fee;
    next.aomq = q.aomq;

    SwapResult result{.fill = q};

    // Fallback mids do not anchor or move the target.
    if (!live->ctx.used_fallback) {
        RecenterOutcome rc = recenter_.on_trade(next.reserves, next.recenter, live->ctx.mid, now_);
        next.recenter = rc.next;
        if (rc.record) {
            next.reserves.target_base = rc.record->new_target;
            result.rebalance = rc.record;
        }
    }

    next.snapshot = make_snapshot(live->ctx, q.regime_flags, block_, now_);

    bool soft_changed = next.soft_divergence.active != state_.soft_divergence.active;
    state_ = std::move(next);

    events_.record_swap(SwapEvent{
        .ts           = now_,
        .block        = block_,
        .is_base_in   = is_base_in,
        .applied_in   = q.applied_in,
        .leftover_in  = q.leftover_in,
        .amount_out   = q.amount_out,
        .fee_bps      = q.fee_bps,
        .mid          = q.mid,
        .regime_flags = q.regime_flags,
        .reason       = q.reason,
    });
    if (soft_changed) {
        events_.record_soft_divergence(SoftDivergenceEvent{
            .ts             = now_,
            .active         = state_.soft_divergence.active,
            .delta_bps      = state_.soft_divergence.last_delta_bps,
            .healthy_streak = state_.soft_divergence.healthy_streak,
        });
    }
    if (q.aomq.active_for(is_base_in)) {
        events_.record_aomq(AomqEvent{
            .ts         = now_,
            .is_base_in = is_base_in,
            .trigger    = q.aomq.trigger,
            .requested  = q.requested_in,
            .clamped_to = q.applied_in,
        });
    }
    if (result.rebalance) events_.record_rebalance(*result.rebalance);
    events_.record_snapshot(state_.snapshot);

    return result;
}

PricingEngine::SidePreview PricingEngine::preview_side(const PricingContext& ctx,
                                                       const AomqActivationState& aomq,
                                                       Amount base_size, bool is_base_in) const {
    Amount amount_in = is_base_in
        ? base_size
        : static_cast<Amount>(std::floor(static_cast<double>(base_size) * ctx.mid));

    SizeClamp clamp = aomq_.clamp_size(amount_in, is_base_in, ctx.mid, aomq);
    double notional = is_base_in ? static_cast<double>(clamp.amount_in) * ctx.mid
                                 : static_cast<double>(clamp.amount_in);
    FeeBreakdown fee = fee_for(ctx, notional, is_base_in, aomq.active_for(is_base_in), false);

    SidePreview out{.fee_bps = fee.total_bps, .clamped = clamp.clamped};
    if (!out.clamped) {
        auto fill = solve_fill(clamp.amount_in, is_base_in, state_.reserves,
                               floors_for(ctx.mid).paying(is_base_in), ctx.mid, fee.total_bps);
        out.clamped = !fill || fill->is_partial;
    }
    return out;
}

Result<FeePreview> PricingEngine::preview_fees(const std::vector<Amount>& sizes) const {
    auto age = check_snapshot(state_.snapshot, config_.preview, now_);
    if (!age) return age.error();

    PricingContext ctx = to_context(state_.snapshot);
    AomqActivationState aomq =
        aomq_.evaluate(ctx.soft_active, state_.reserves, floors_for(ctx.mid), ctx.used_fallback);

    FeePreview out;
    out.snapshot_age_sec = *age;
    out.ask_fee_bps.reserve(sizes.size());
    out.bid_fee_bps.reserve(sizes.size());
    for (Amount size : sizes) {
        out.ask_fee_bps.push_back(preview_side(ctx, aomq, size, false).fee_bps);
        out.bid_fee_bps.push_back(preview_side(ctx, aomq, size, true).fee_bps);
    }
    return out;
}

Result<PreviewLadder> PricingEngine::preview_ladder(Amount base_size) const {
    auto age = check_snapshot(state_.snapshot, config_.preview, now_);
    if (!age) return age.error();

    PricingContext ctx = to_context(state_.snapshot);
    if (base_size == 0) {
        base_size = std::max<Amount>(
            1, static_cast<Amount>(std::floor(config_.maker.s0_notional / ctx.mid)));
    }
    AomqActivationState aomq =
        aomq_.evaluate(ctx.soft_active, state_.reserves, floors_for(ctx.mid), ctx.used_fallback);

    PreviewLadder ladder;
    ladder.snapshot_age_sec = *age;
    ladder.snapshot_timestamp = state_.snapshot.timestamp;
    ladder.snapshot_mid = ctx.mid;
    for (uint32_t mult : kLadderMultipliers) {
        Amount size = base_size * mult;
        SidePreview ask = preview_side(ctx, aomq, size, false);
        SidePreview bid = preview_side(ctx, aomq, size, true);
        ladder.sizes.push_back(size);
        ladder.ask_fee_bps.push_back(ask.fee_bps);
        ladder.bid_fee_bps.push_back(bid.fee_bps);
        ladder.ask_clamped.push_back(ask.clamped);
        ladder.bid_clamped.push_back(bid.clamped);
    }
    return ladder;
}

uint32_t PricingEngine::snapshot_flags(const PricingContext& ctx,
                                       const AomqActivationState& aomq) const {
    uint32_t flags = 0;
    if (aomq.any()) flags |= kRegimeAomq;
    if (ctx.used_fallback) flags |= kRegimeFallback;
    ReserveFloors floors = floors_for(ctx.mid);
    if (aomq_.near_floor(state_.reserves.base_reserve, floors.base) ||
        aomq_.near_floor(state_.reserves.quote_reserve, floors.quote)) {
        flags |= kRegimeNearFloor;
    }
    if (ctx.soft_active) flags |= kRegimeSoftDivergence;
    return flags;
}

Result<void> PricingEngine::refresh_preview_snapshot(OracleMode mode) {
    const PreviewSnapshot& current = state_.snapshot;
    uint64_t cooldown = config_.preview.snapshot_cooldown_sec;
    if (current.valid && cooldown > 0 && now_ < current.timestamp + cooldown) {
        return make_error(ErrorCode::PreviewSnapshotCooldown, "snapshot refreshed too recently",
                          static_cast<double>(snapshot_age_sec(current, now_)),
                          static_cast<double>(cooldown));
    }

    auto live = read_live(mode);
    if (!live) return live.error();

    AomqActivationState aomq =
        aomq_.evaluate(live->ctx.soft_active, state_.reserves, floors_for(live->ctx.mid),
                       live->ctx.used_fallback);
    state_.snapshot = make_snapshot(live->ctx, snapshot_flags(live->ctx, aomq), block_, now_);
    events_.record_snapshot(state_.snapshot);
    return {};
}

Result<void> PricingEngine::manual_rebalance() {
    auto ref = fusion_.read_reference_price(OracleMode::Strict, sigma_bps());
    if (!ref) return ref.error();

    if (ref->used_fallback) {
        if (ref->reason == FallbackReason::PrimaryStale) {
            return make_error(ErrorCode::OracleStale, "primary reading stale",
                              ref->primary_age_sec, config_.oracle.max_age_sec);
        }
        return make_error(ErrorCode::MidUnset, "primary reading unset");
    }

    if (ref->secondary) {
        auto div = gate_.evaluate(ref->mid, ref->secondary->mid, state_.soft_divergence);
        if (!div) return div.error();
    }

    auto outcome = recenter_.manual(state_.reserves, state_.recenter, ref->mid, now_);
    if (!outcome) return outcome.error();

    state_.recenter = outcome->next;
    if (outcome->record) {
        state_.reserves.target_base = outcome->record->new_target;
        events_.record_rebalance(*outcome->record);
    }
    return {};
}

} // namespace dnmm
