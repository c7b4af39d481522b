#include "sim/simulation_metrics.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace dnmm {

void SimulationMetrics::record_trade(const TradeRow& row) {
    trades_.push_back(row);
}

void SimulationMetrics::record_reject(ErrorCode code) {
    rejects_[code]++;
}

SimulationSummary SimulationMetrics::compute_summary() const {
    SimulationSummary s;
    s.rejects_by_reason = rejects_;
    for (const auto& [_, n] : rejects_) s.rejects += n;

    if (trades_.empty()) return s;

    double fee_sum = 0.0;
    s.min_base_reserve = trades_.front().base_reserve;
    s.min_quote_reserve = trades_.front().quote_reserve;
    for (const auto& t : trades_) {
        s.fills++;
        if (t.leftover_in > 0) s.partial_fills++;
        if (t.regime_flags & kRegimeAomq) s.aomq_fills++;
        if (t.regime_flags & kRegimeFallback) s.fallback_fills++;
        fee_sum += t.fee_bps;
        s.max_fee_bps = std::max(s.max_fee_bps, t.fee_bps);
        s.min_base_reserve = std::min(s.min_base_reserve, t.base_reserve);
        s.min_quote_reserve = std::min(s.min_quote_reserve, t.quote_reserve);
    }
    s.avg_fee_bps = fee_sum / static_cast<double>(trades_.size());
    return s;
}

void SimulationMetrics::write_csv(const std::string& filename) const {
    std::ofstream f(filename);
    f << "step,timestamp,mid,side,requested_in,applied_in,leftover_in,amount_out,fee_bps,"
         "regime_flags,reason,base_reserve,quote_reserve,target_base\n";

    for (const auto& t : trades_) {
        f << t.step << ","
          << t.ts << ","
          << std::fixed << std::setprecision(6)
          << t.mid << ","
          << (t.is_base_in ? "base_in" : "quote_in") << ","
          << t.requested_in << ","
          << t.applied_in << ","
          << t.leftover_in << ","
          << t.amount_out << ","
          << std::setprecision(4) << t.fee_bps << ","
          << t.regime_flags << ","
          << to_string(t.reason) << ","
          << t.base_reserve << ","
          << t.quote_reserve << ","
          << t.target_base << "\n";
    }
}

std::string SimulationMetrics::generate_report(const EventLog& events) const {
    auto s = compute_summary();

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "# DNMM Simulation Report\n\n";

    ss << "## Trades\n\n";
    ss << "| Metric | Value |\n";
    ss << "|--------|-------|\n";
    ss << "| Fills | " << s.fills << " |\n";
    ss << "| Partial Fills | " << s.partial_fills << " |\n";
    ss << "| AOMQ Fills | " << s.aomq_fills << " |\n";
    ss << "| Fallback Fills | " << s.fallback_fills << " |\n";
    ss << "| Rejects | " << s.rejects << " |\n";
    ss << "| Avg Fee (bps) | " << s.avg_fee_bps << " |\n";
    ss << "| Max Fee (bps) | " << s.max_fee_bps << " |\n";
    ss << "| Min Base Reserve | " << s.min_base_reserve << " |\n";
    ss << "| Min Quote Reserve | " << s.min_quote_reserve << " |\n";
    ss << "\n";

    if (!s.rejects_by_reason.empty()) {
        ss << "## Rejects by Reason\n\n";
        ss << "| Reason | Count |\n";
        ss << "|--------|-------|\n";
        for (const auto& [code, n] : s.rejects_by_reason) {
            ss << "| " << to_string(code) << " | " << n << " |\n";
        }
        ss << "\n";
    }

    ss << "## Engine Events\n\n";
    ss << events.summary();
    return ss.str();
}

} // namespace dnmm
