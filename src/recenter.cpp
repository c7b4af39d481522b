#include "inventory/recenter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace dnmm {

const char* to_string(RecenterTrigger trigger) {
    switch (trigger) {
        case RecenterTrigger::Auto:   return "auto";
        case RecenterTrigger::Manual: return "manual";
    }
    return "unknown";
}

Recenter::Recenter(InventoryConfig config, bool auto_enabled)
    : config_(std::move(config)), auto_enabled_(auto_enabled) {}

RecenterState Recenter::initial_state() const {
    return RecenterState{.healthy_streak = config_.recenter_healthy_frames};
}

double Recenter::price_deviation_bps(const RecenterState& state, double price) const {
    if (!state.has_anchor || state.last_rebalance_price <= 0.0) return 0.0;
    return std::abs(price - state.last_rebalance_price) / state.last_rebalance_price * kBps;
}

bool Recenter::cooldown_elapsed(const RecenterState& state, Timestamp now) const {
    if (!state.has_committed) return true;
    return now >= state.last_rebalance_ts + config_.recenter_cooldown_sec;
}

std::optional<Amount> Recenter::perform_rebalance(const ReserveState& reserves, double price) const {
    if (price <= 0.0) return std::nullopt;

    double total_notional = static_cast<double>(reserves.quote_reserve)
                          + static_cast<double>(reserves.base_reserve) * price;
    // The epsilon keeps an exact half (e.g. 1100 / 1.1) from flooring one unit low.
    auto new_target = static_cast<Amount>(std::floor(total_notional / 2.0 / price + 1e-9));

    if (new_target == reserves.target_base) return std::nullopt;
    if (reserves.target_base > 0) {
        double old_target = static_cast<double>(reserves.target_base);
        double change_bps = std::abs(static_cast<double>(new_target) - old_target) / old_target * kBps;
        if (change_bps < config_.recenter_min_change_bps) return std::nullopt;
    }
    return new_target;
}

RecenterOutcome Recenter::commit(const ReserveState& reserves, const RecenterState& state,
                                 Amount new_target, double price, Timestamp now,
                                 RecenterTrigger trigger) const {
    RecenterOutcome out;
    out.status = RecenterStatus::Committed;
    out.next = state;
    out.next.last_rebalance_price = price;
    out.next.last_rebalance_ts = now;
    out.next.healthy_streak = 0;
    out.next.has_anchor = true;
    out.next.has_committed = true;
    out.record = RebalanceRecord{
        .old_target = reserves.target_base,
        .new_target = new_target,
        .price      = price,
        .ts         = now,
        .trigger    = trigger,
    };
    return out;
}

RecenterOutcome Recenter::on_trade(const ReserveState& reserves, const RecenterState& state,
                                   double price, Timestamp now) const {
    RecenterOutcome idle{.status = RecenterStatus::Idle, .next = state};
    if (!auto_enabled_ || price <= 0.0) return idle;

    if (!state.has_anchor) {
        idle.next.last_rebalance_price = price;
        idle.next.has_anchor = true;
        return idle;
    }

    if (price_deviation_bps(state, price) < config_.recenter_threshold_bps) {
        idle.next.healthy_streak = std::min(state.healthy_streak + 1, config_.recenter_healthy_frames);
        return idle;
    }

    if (!cooldown_elapsed(state, now)) return idle;
    if (state.healthy_streak < config_.recenter_healthy_frames) return idle;

    auto new_target = perform_rebalance(reserves, price);
    if (!new_target) return idle;

    return commit(reserves, state, *new_target, price, now, RecenterTrigger::Auto);
}

Result<RecenterOutcome> Recenter::manual(const ReserveState& reserves, const RecenterState& state,
                                         double price, Timestamp now) const {
    if (!cooldown_elapsed(state, now)) {
        return make_error(ErrorCode::RecenterCooldown, "recenter cooldown active",
                          static_cast<double>(now - state.last_rebalance_ts),
                          static_cast<double>(config_.recenter_cooldown_sec));
    }

    double deviation = price_deviation_bps(state, price);
    if (state.has_anchor && deviation < config_.recenter_threshold_bps) {
        return make_error(ErrorCode::RecenterThreshold, "mid has not moved enough",
                          deviation, config_.recenter_threshold_bps);
    }

    auto new_target = perform_rebalance(reserves, price);
    if (!new_target) {
        return make_error(ErrorCode::RecenterThreshold, "target change below minimum",
                          0.0, config_.recenter_min_change_bps);
    }

    return commit(reserves, state, *new_target, price, now, RecenterTrigger::Manual);
}

} // namespace dnmm
