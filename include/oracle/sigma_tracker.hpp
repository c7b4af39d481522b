#pragma once

#include "core/types.hpp"

namespace dnmm {

struct SigmaState {
    double      last_mid      = 0.0;
    double      ewma_variance = 0.0;   // in bps^2
    BlockNumber last_block    = 0;
    bool        has_mid       = false;
    bool        initialized   = false;
};

// EWMA of block-to-block log returns of the reference mid.
class SigmaTracker {
public:
    static constexpr double kDefaultLambdaBps = 5000.0;

    explicit SigmaTracker(double lambda_bps = kDefaultLambdaBps);

    // Returns the state after observing mid at block. At most one update per
    // block; later observations in the same block leave the state unchanged.
    SigmaState observe(const SigmaState& state, double mid, BlockNumber block) const;

    static double sigma_bps(const SigmaState& state);

private:
    double lambda_;   // weight kept on the previous variance
};

} // namespace dnmm
