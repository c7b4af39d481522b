#pragma once

#include "config/pool_config.hpp"
#include "inventory/inventory_solver.hpp"
#include "inventory/reserve_state.hpp"

#include <cstdint>

namespace dnmm {

enum class AomqTrigger : uint8_t { None, SoftDivergence, NearFloor, Fallback };

const char* to_string(AomqTrigger trigger);

// Bid side: trader sells base, pool pays quote. Ask side: trader buys base,
// pool pays base. Recomputed on every call.
struct AomqActivationState {
    bool        ask_active = false;
    bool        bid_active = false;
    AomqTrigger trigger    = AomqTrigger::None;

    bool active_for(bool is_base_in) const { return is_base_in ? bid_active : ask_active; }
    bool any() const { return ask_active || bid_active; }
};

struct SizeClamp {
    Amount amount_in = 0;
    Amount leftover  = 0;
    bool   clamped   = false;
};

class DegradedQuoteMode {
public:
    // max_fee_bps bounds the fee a clamped trade can pay.
    DegradedQuoteMode(AomqConfig config, double max_fee_bps, bool enabled);

    // Triggers in order: soft divergence, floor proximity, fallback oracle.
    AomqActivationState evaluate(bool soft_divergence_active, const ReserveState& reserves,
                                 const ReserveFloors& floors, bool used_fallback) const;

    bool near_floor(Amount reserve, Amount floor) const;

    // Smallest input that pays out at least one unit at the maximum fee.
    Amount min_fillable_in(bool is_base_in, double mid) const;

    // Caps the trade notional at min_quote_notional on an active side, but
    // never below min_fillable_in.
    SizeClamp clamp_size(Amount amount_in, bool is_base_in, double mid,
                         const AomqActivationState& state) const;

    bool enabled() const { return enabled_; }

private:
    AomqConfig config_;
    double     max_fee_bps_;
    bool       enabled_;
};

} // namespace dnmm
