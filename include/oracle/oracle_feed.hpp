#pragma once

namespace dnmm {

struct MidAndAge {
    double mid     = 0.0;
    double age_sec = 0.0;
    bool   ok      = false;
};

struct BidAsk {
    double bid = 0.0;
    double ask = 0.0;
    bool   ok  = false;
};

struct EmaMid {
    double mid = 0.0;
    bool   ok  = false;
};

struct SecondaryMid {
    double mid      = 0.0;
    double conf_bps = 0.0;
    double age_sec  = 0.0;
    bool   ok       = false;
};

// Adapter over the external price sources. Reads are synchronous and must not
// mutate engine-visible state.
class IOracleFeed {
public:
    virtual ~IOracleFeed() = default;
    virtual MidAndAge    read_mid_and_age() const = 0;
    virtual BidAsk       read_bid_ask() const = 0;
    virtual EmaMid       read_ema_fallback() const = 0;
    virtual SecondaryMid read_secondary_mid() const = 0;
};

} // namespace dnmm
