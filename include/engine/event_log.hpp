#pragma once

#include "aomq/degraded_quote_mode.hpp"
#include "engine/quote_types.hpp"
#include "inventory/recenter.hpp"
#include "preview/preview_snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace dnmm {

struct SwapEvent {
    Timestamp   ts            = 0;
    BlockNumber block         = 0;
    bool        is_base_in    = true;
    Amount      applied_in    = 0;
    Amount      leftover_in   = 0;
    Amount      amount_out    = 0;
    double      fee_bps       = 0.0;
    double      mid           = 0.0;
    uint32_t    regime_flags  = 0;
    QuoteReason reason        = QuoteReason::Normal;
};

struct SoftDivergenceEvent {
    Timestamp ts        = 0;
    bool      active    = false;
    double    delta_bps = 0.0;
    uint32_t  healthy_streak = 0;
};

struct AomqEvent {
    Timestamp   ts         = 0;
    bool        is_base_in = true;
    AomqTrigger trigger    = AomqTrigger::None;
    Amount      requested  = 0;
    Amount      clamped_to = 0;
};

struct EventCounters {
    uint64_t swaps                    = 0;
    uint64_t partial_fills            = 0;
    uint64_t rebalances               = 0;
    uint64_t soft_divergence_changes  = 0;
    uint64_t aomq_activations         = 0;
    uint64_t snapshots                = 0;
    uint64_t fallback_swaps           = 0;
};

// Events emitted by committed operations only. Each history keeps the last
// kMaxEvents entries; counters cover the whole run.
class EventLog {
public:
    static constexpr size_t kMaxEvents = 4096;

    void record_swap(const SwapEvent& event);
    void record_rebalance(const RebalanceRecord& record);
    void record_soft_divergence(const SoftDivergenceEvent& event);
    void record_aomq(const AomqEvent& event);
    void record_snapshot(const PreviewSnapshot& snapshot);

    const std::deque<SwapEvent>& swaps() const { return swaps_; }
    const std::deque<RebalanceRecord>& rebalances() const { return rebalances_; }
    const std::deque<SoftDivergenceEvent>& soft_divergence() const { return soft_divergence_; }
    const std::deque<AomqEvent>& aomq() const { return aomq_; }
    const PreviewSnapshot& last_snapshot() const { return last_snapshot_; }
    const EventCounters& counters() const { return counters_; }

    std::string summary() const;

private:
    std::deque<SwapEvent>           swaps_;
    std::deque<RebalanceRecord>     rebalances_;
    std::deque<SoftDivergenceEvent> soft_divergence_;
    std::deque<AomqEvent>           aomq_;
    PreviewSnapshot                  last_snapshot_;
    EventCounters                    counters_;
};

} // namespace dnmm
