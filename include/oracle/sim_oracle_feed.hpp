#pragma once

#include "oracle/oracle_feed.hpp"

namespace dnmm {

// Scripted feed for tests and the simulator. Every source starts unavailable.
class SimOracleFeed : public IOracleFeed {
public:
    MidAndAge    read_mid_and_age() const override;
    BidAsk       read_bid_ask() const override;
    EmaMid       read_ema_fallback() const override;
    SecondaryMid read_secondary_mid() const override;

    void set_primary(double mid, double age_sec = 0.0);
    void set_bid_ask(double bid, double ask);
    void set_ema(double mid);
    void set_secondary(double mid, double conf_bps = 0.0, double age_sec = 0.0);

    // Sets primary mid, a symmetric spread around it and a matching secondary.
    void set_all(double mid, double spread_bps, double secondary_conf_bps = 0.0);

    void clear_primary()   { primary_.ok = false; }
    void clear_bid_ask()   { bid_ask_.ok = false; }
    void clear_ema()       { ema_.ok = false; }
    void clear_secondary() { secondary_.ok = false; }

private:
    MidAndAge    primary_;
    BidAsk       bid_ask_;
    EmaMid       ema_;
    SecondaryMid secondary_;
};

} // namespace dnmm
