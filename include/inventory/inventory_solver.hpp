#pragma once

#include "config/pool_config.hpp"
#include "core/result.hpp"
#include "inventory/reserve_state.hpp"

namespace dnmm {

struct FillResult {
    Amount requested_in = 0;
    Amount applied_in   = 0;
    Amount leftover_in  = 0;   // returned to the caller, never retained
    Amount amount_out   = 0;
    bool   is_partial   = false;
};

struct ReserveFloors {
    Amount base  = 0;
    Amount quote = 0;

    Amount paying(bool is_base_in) const { return is_base_in ? quote : base; }
};

// Each side keeps the larger of its absolute floor and floor_bps of the
// target base, valued at mid on the quote side. Moves with every recenter.
ReserveFloors reserve_floors(const InventoryConfig& config, const ReserveState& reserves,
                             double mid);

// Output per unit of input after fees: price for base in, 1/price for quote in.
double effective_rate(bool is_base_in, double price, double fee_bps);

// Output for a full fill, rounded down.
Amount amount_out_for(Amount amount_in, bool is_base_in, double price, double fee_bps);

// Largest fill that keeps the paying reserve at or above floor. A clamped
// fill pays out exactly down to the floor and charges the smallest input that
// covers it. Fails with FloorBreach when nothing can be paid out.
Result<FillResult> solve_fill(Amount desired_in, bool is_base_in, const ReserveState& reserves,
                              Amount floor, double price, double fee_bps);

} // namespace dnmm
