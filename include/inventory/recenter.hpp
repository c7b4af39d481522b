#pragma once

#include "config/pool_config.hpp"
#include "core/result.hpp"
#include "inventory/reserve_state.hpp"

#include <cstdint>
#include <optional>

namespace dnmm {

struct RecenterState {
    double    last_rebalance_price = 0.0;   // anchor for the deviation trigger
    Timestamp last_rebalance_ts    = 0;
    uint32_t  healthy_streak       = 0;
    bool      has_anchor           = false;
    bool      has_committed        = false;
};

enum class RecenterTrigger : uint8_t { Auto, Manual };
enum class RecenterStatus : uint8_t { Idle, Committed };

const char* to_string(RecenterTrigger trigger);

struct RebalanceRecord {
    Amount          old_target = 0;
    Amount          new_target = 0;
    double          price      = 0.0;
    Timestamp       ts         = 0;
    RecenterTrigger trigger    = RecenterTrigger::Auto;
};

struct RecenterOutcome {
    RecenterStatus                 status = RecenterStatus::Idle;
    RecenterState                  next;
    std::optional<RebalanceRecord> record;
};

// Idle -> Committed -> Idle. The automatic path needs the mid to have moved
// by the threshold, the cooldown to have elapsed and enough sub-threshold
// observations since the last commit. The manual path skips the streak.
class Recenter {
public:
    Recenter(InventoryConfig config, bool auto_enabled);

    // A pool that has never recentered starts with a satisfied streak.
    RecenterState initial_state() const;

    double price_deviation_bps(const RecenterState& state, double price) const;
    bool cooldown_elapsed(const RecenterState& state, Timestamp now) const;

    // New target = half the pool's value at price, in base. Empty when the
    // change from the current target is below the minimum worth committing.
    std::optional<Amount> perform_rebalance(const ReserveState& reserves, double price) const;

    RecenterOutcome on_trade(const ReserveState& reserves, const RecenterState& state,
                             double price, Timestamp now) const;

    Result<RecenterOutcome> manual(const ReserveState& reserves, const RecenterState& state,
                                   double price, Timestamp now) const;

private:
    RecenterOutcome commit(const ReserveState& reserves, const RecenterState& state, Amount new_target,
                           double price, Timestamp now, RecenterTrigger trigger) const;

    InventoryConfig config_;
    bool            auto_enabled_;
};

} // namespace dnmm
