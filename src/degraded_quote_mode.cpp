#include "aomq/degraded_quote_mode.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace dnmm {

const char* to_string(AomqTrigger trigger) {
    switch (trigger) {
        case AomqTrigger::None:           return "none";
        case AomqTrigger::SoftDivergence: return "soft_divergence";
        case AomqTrigger::NearFloor:      return "near_floor";
        case AomqTrigger::Fallback:       return "fallback";
    }
    return "unknown";
}

DegradedQuoteMode::DegradedQuoteMode(AomqConfig config, double max_fee_bps, bool enabled)
    : config_(std::move(config)), max_fee_bps_(max_fee_bps), enabled_(enabled) {}

bool DegradedQuoteMode::near_floor(Amount reserve, Amount floor) const {
    if (reserve <= floor) return true;
    double headroom = static_cast<double>(reserve - floor);
    return headroom * kBps <= config_.floor_epsilon_bps * static_cast<double>(reserve);
}

AomqActivationState DegradedQuoteMode::evaluate(bool soft_divergence_active,
                                                const ReserveState& reserves,
                                                const ReserveFloors& floors,
                                                bool used_fallback) const {
    AomqActivationState state;
    if (!enabled_) return state;

    if (soft_divergence_active) {
        state.ask_active = state.bid_active = true;
        state.trigger = AomqTrigger::SoftDivergence;
    }

    bool base_near = near_floor(reserves.base_reserve, floors.base);
    bool quote_near = near_floor(reserves.quote_reserve, floors.quote);
    if (base_near || quote_near) {
        state.ask_active = state.ask_active || base_near;
        state.bid_active = state.bid_active || quote_near;
        if (state.trigger == AomqTrigger::None) state.trigger = AomqTrigger::NearFloor;
    }

    if (used_fallback) {
        state.ask_active = state.bid_active = true;
        if (state.trigger == AomqTrigger::None) state.trigger = AomqTrigger::Fallback;
    }
    return state;
}

Amount DegradedQuoteMode::min_fillable_in(bool is_base_in, double mid) const {
    double rate = effective_rate(is_base_in, mid, max_fee_bps_);
    if (!(rate > 0.0)) return std::numeric_limits<Amount>::max();
    // floor(1/rate) + 1 is strictly above 1/rate, so it pays out at least one unit.
    double units = std::floor(1.0 / rate) + 1.0;
    if (units >= static_cast<double>(std::numeric_limits<Amount>::max())) {
        return std::numeric_limits<Amount>::max();
    }
    return static_cast<Amount>(units);
}

SizeClamp DegradedQuoteMode::clamp_size(Amount amount_in, bool is_base_in, double mid,
                                        const AomqActivationState& state) const {
    SizeClamp out{.amount_in = amount_in};
    if (!enabled_ || !state.active_for(is_base_in) || mid <= 0.0) return out;

    double notional = is_base_in ? static_cast<double>(amount_in) * mid
                                 : static_cast<double>(amount_in);
    if (notional <= config_.min_quote_notional) return out;

    double max_in = is_base_in ? config_.min_quote_notional / mid : config_.min_quote_notional;
    auto capped = static_cast<Amount>(std::floor(max_in));
    capped = std::max(capped, min_fillable_in(is_base_in, mid));
    if (capped >= amount_in) return out;

    out.amount_in = capped;
    out.leftover = amount_in - capped;
    out.clamped = true;
    return out;
}

} // namespace dnmm
