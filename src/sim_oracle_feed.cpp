#include "oracle/sim_oracle_feed.hpp"

#include "core/types.hpp"

namespace dnmm {

MidAndAge SimOracleFeed::read_mid_and_age() const {
    return primary_;
}

BidAsk SimOracleFeed::read_bid_ask() const {
    return bid_ask_;
}

EmaMid SimOracleFeed::read_ema_fallback() const {
    return ema_;
}

SecondaryMid SimOracleFeed::read_secondary_mid() const {
    return secondary_;
}

void SimOracleFeed::set_primary(double mid, double age_sec) {
    primary_ = MidAndAge{.mid = mid, .age_sec = age_sec, .ok = true};
}

void SimOracleFeed::set_bid_ask(double bid, double ask) {
    bid_ask_ = BidAsk{.bid = bid, .ask = ask, .ok = true};
}

void SimOracleFeed::set_ema(double mid) {
    ema_ = EmaMid{.mid = mid, .ok = true};
}

void SimOracleFeed::set_secondary(double mid, double conf_bps, double age_sec) {
    secondary_ = SecondaryMid{.mid = mid, .conf_bps = conf_bps, .age_sec = age_sec, .ok = true};
}

void SimOracleFeed::set_all(double mid, double spread_bps, double secondary_conf_bps) {
    double half = mid * spread_bps / kBps / 2.0;
    set_primary(mid);
    set_bid_ask(mid - half, mid + half);
    set_ema(mid);
    set_secondary(mid, secondary_conf_bps);
}

} // namespace dnmm
