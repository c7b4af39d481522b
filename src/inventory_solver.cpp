#include "inventory/inventory_solver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace dnmm {

namespace {

Amount to_amount_down(double value) {
    if (!(value > 0.0)) return 0;
    if (value >= static_cast<double>(std::numeric_limits<Amount>::max())) {
        return std::numeric_limits<Amount>::max();
    }
    return static_cast<Amount>(std::floor(value));
}

} // anonymous namespace

ReserveFloors reserve_floors(const InventoryConfig& config, const ReserveState& reserves,
                             double mid) {
    ReserveFloors floors{.base = config.base_floor, .quote = config.quote_floor};
    if (config.floor_bps <= 0.0) return floors;

    double base_share = static_cast<double>(reserves.target_base) * config.floor_bps / kBps;
    floors.base = std::max(floors.base, to_amount_down(base_share));
    if (mid > 0.0) floors.quote = std::max(floors.quote, to_amount_down(base_share * mid));
    return floors;
}

double effective_rate(bool is_base_in, double price, double fee_bps) {
    if (price <= 0.0) return 0.0;
    double net = 1.0 - fee_bps / kBps;
    if (net <= 0.0) return 0.0;
    return is_base_in ? price * net : net / price;
}

Amount amount_out_for(Amount amount_in, bool is_base_in, double price, double fee_bps) {
    return to_amount_down(static_cast<double>(amount_in) * effective_rate(is_base_in, price, fee_bps));
}

Result<FillResult> solve_fill(Amount desired_in, bool is_base_in, const ReserveState& reserves,
                              Amount floor, double price, double fee_bps) {
    if (desired_in == 0) {
        return make_error(ErrorCode::ZeroAmount, "zero input");
    }

    Amount reserve_out = reserves.paying_reserve(is_base_in);
    Amount available = reserve_out > floor ? reserve_out - floor : 0;
    if (available == 0) {
        return make_error(ErrorCode::FloorBreach, "reserve at floor",
                          static_cast<double>(reserve_out), static_cast<double>(floor));
    }

    double rate = effective_rate(is_base_in, price, fee_bps);
    Amount full_out = to_amount_down(static_cast<double>(desired_in) * rate);
    if (full_out == 0) {
        return make_error(ErrorCode::ZeroAmount, "input too small to produce output",
                          static_cast<double>(desired_in));
    }

    FillResult fill{.requested_in = desired_in};

    if (full_out <= available) {
        fill.applied_in = desired_in;
        fill.amount_out = full_out;
        return fill;
    }

    // Clamp: pay out exactly down to the floor.
    double needed = static_cast<double>(available) / rate;
    Amount required = static_cast<Amount>(std::ceil(needed));
    // Undo a ceil that floating point pushed one unit too far.
    if (required > 1 && to_amount_down(static_cast<double>(required - 1) * rate) >= available) {
        --required;
    }
    if (required > desired_in) required = desired_in;

    fill.applied_in = required;
    fill.leftover_in = desired_in - required;
    fill.amount_out = available;
    fill.is_partial = fill.leftover_in > 0;
    return fill;
}

} // namespace dnmm
