#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/event_log.hpp"
#include "engine/quote_types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace dnmm {

struct TradeRow {
    uint64_t    step          = 0;
    Timestamp   ts            = 0;
    double      mid           = 0.0;
    bool        is_base_in    = true;
    Amount      requested_in  = 0;
    Amount      applied_in    = 0;
    Amount      leftover_in   = 0;
    Amount      amount_out    = 0;
    double      fee_bps       = 0.0;
    uint32_t    regime_flags  = 0;
    QuoteReason reason        = QuoteReason::Normal;
    Amount      base_reserve  = 0;
    Amount      quote_reserve = 0;
    Amount      target_base   = 0;
};

struct SimulationSummary {
    uint64_t fills            = 0;
    uint64_t partial_fills    = 0;
    uint64_t aomq_fills       = 0;
    uint64_t fallback_fills   = 0;
    uint64_t rejects          = 0;
    double   avg_fee_bps      = 0.0;
    double   max_fee_bps      = 0.0;
    Amount   min_base_reserve  = 0;
    Amount   min_quote_reserve = 0;
    std::map<ErrorCode, uint64_t> rejects_by_reason;
};

class SimulationMetrics {
public:
    void record_trade(const TradeRow& row);
    void record_reject(ErrorCode code);

    SimulationSummary compute_summary() const;
    const std::vector<TradeRow>& trades() const { return trades_; }

    void write_csv(const std::string& filename) const;
    std::string generate_report(const EventLog& events) const;

private:
    std::vector<TradeRow>         trades_;
    std::map<ErrorCode, uint64_t> rejects_;
};

} // namespace dnmm
