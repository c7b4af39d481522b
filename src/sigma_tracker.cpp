#include "oracle/sigma_tracker.hpp"

#include <cmath>

namespace dnmm {

SigmaTracker::SigmaTracker(double lambda_bps)
    : lambda_(lambda_bps / kBps) {}

SigmaState SigmaTracker::observe(const SigmaState& state, double mid, BlockNumber block) const {
    if (mid <= 0.0) return state;
    if (state.has_mid && block <= state.last_block) return state;

    SigmaState next = state;
    next.last_mid = mid;
    next.last_block = block;
    next.has_mid = true;

    if (!state.has_mid || state.last_mid <= 0.0) {
        return next;
    }

    double r_bps = std::log(mid / state.last_mid) * kBps;

    if (!state.initialized) {
        next.ewma_variance = r_bps * r_bps;
        next.initialized = true;
    } else {
        // variance_t = lambda * variance_{t-1} + (1 - lambda) * r_t^2
        next.ewma_variance = lambda_ * state.ewma_variance + (1.0 - lambda_) * (r_bps * r_bps);
    }
    return next;
}

double SigmaTracker::sigma_bps(const SigmaState& state) {
    return std::sqrt(state.ewma_variance);
}

} // namespace dnmm
