#include "engine/event_log.hpp"

#include <iomanip>
#include <sstream>

namespace dnmm {

namespace {

template <typename T>
void append_bounded(std::deque<T>& history, const T& event) {
    history.push_back(event);
    if (history.size() > EventLog::kMaxEvents) history.pop_front();
}

} // anonymous namespace

void EventLog::record_swap(const SwapEvent& event) {
    append_bounded(swaps_, event);

    counters_.swaps++;
    if (event.leftover_in > 0) counters_.partial_fills++;
    if (event.regime_flags & kRegimeFallback) counters_.fallback_swaps++;
}

void EventLog::record_rebalance(const RebalanceRecord& record) {
    append_bounded(rebalances_, record);
    counters_.rebalances++;
}

void EventLog::record_soft_divergence(const SoftDivergenceEvent& event) {
    append_bounded(soft_divergence_, event);
    counters_.soft_divergence_changes++;
}

void EventLog::record_aomq(const AomqEvent& event) {
    append_bounded(aomq_, event);
    counters_.aomq_activations++;
}

void EventLog::record_snapshot(const PreviewSnapshot& snapshot) {
    last_snapshot_ = snapshot;
    counters_.snapshots++;
}

std::string EventLog::summary() const {
    std::ostringstream ss;
    ss << "| Event | Count |\n";
    ss << "|-------|-------|\n";
    ss << "| Swaps | " << counters_.swaps << " |\n";
    ss << "| Partial Fills | " << counters_.partial_fills << " |\n";
    ss << "| Fallback Swaps | " << counters_.fallback_swaps << " |\n";
    ss << "| Target Updates | " << counters_.rebalances << " |\n";
    ss << "| Soft Divergence Changes | " << counters_.soft_divergence_changes << " |\n";
    ss << "| AOMQ Activations | " << counters_.aomq_activations << " |\n";
    ss << "| Snapshots | " << counters_.snapshots << " |\n";

    if (!rebalances_.empty()) {
        ss << "\n| Trigger | Timestamp | Price | Old Target | New Target |\n";
        ss << "|---------|-----------|-------|------------|------------|\n";
        ss << std::fixed << std::setprecision(6);
        for (const auto& r : rebalances_) {
            ss << "| " << to_string(r.trigger)
               << " | " << r.ts
               << " | " << r.price
               << " | " << r.old_target
               << " | " << r.new_target
               << " |\n";
        }
    }
    return ss.str();
}

} // namespace dnmm
