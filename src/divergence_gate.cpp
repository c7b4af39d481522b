#include "oracle/divergence_gate.hpp"

#include <algorithm>
#include <utility>

namespace dnmm {

const char* to_string(DivergenceBand band) {
    switch (band) {
        case DivergenceBand::Accept:   return "accept";
        case DivergenceBand::Soft:     return "soft";
        case DivergenceBand::Stress:   return "stress";
        case DivergenceBand::NoSignal: return "no_signal";
    }
    return "unknown";
}

DivergenceGate::DivergenceGate(DivergenceConfig config, bool soft_enabled)
    : config_(std::move(config)), soft_enabled_(soft_enabled) {}

double DivergenceGate::delta_bps(double a, double b) {
    double hi = std::max(a, b);
    double lo = std::min(a, b);
    if (hi <= 0.0) return 0.0;
    return (hi - lo) / hi * kBps;
}

double DivergenceGate::haircut_bps(double delta_bps) const {
    if (delta_bps <= config_.accept_bps) return 0.0;
    return config_.haircut_min_bps + config_.haircut_slope_bps * (delta_bps - config_.accept_bps);
}

DivergenceOutcome DivergenceGate::no_signal(const SoftDivergenceState& current) const {
    return DivergenceOutcome{.band = DivergenceBand::NoSignal, .next = current};
}

Result<DivergenceOutcome> DivergenceGate::evaluate(double primary_mid, double secondary_mid,
                                                   const SoftDivergenceState& current) const {
    if (primary_mid <= 0.0 || secondary_mid <= 0.0) {
        return no_signal(current);
    }

    double delta = delta_bps(primary_mid, secondary_mid);
    DivergenceOutcome out;
    out.delta_bps = delta;
    out.next = current;
    out.next.last_delta_bps = delta;

    // Legacy single gate: no haircut, no hysteresis.
    if (!soft_enabled_) {
        if (delta > config_.divergence_bps) {
            return make_error(ErrorCode::DivergenceHard, "primary/secondary divergence",
                              delta, config_.divergence_bps);
        }
        out.band = DivergenceBand::Accept;
        out.next = current;
        return out;
    }

    if (delta > config_.hard_bps) {
        return make_error(ErrorCode::DivergenceHard, "primary/secondary divergence",
                          delta, config_.hard_bps);
    }

    if (delta <= config_.accept_bps) {
        out.band = DivergenceBand::Accept;
        out.next.healthy_streak = std::min(current.healthy_streak + 1, config_.healthy_frames);
        if (current.active && out.next.healthy_streak >= config_.healthy_frames) {
            out.next.active = false;
        }
        return out;
    }

    out.band = (delta <= config_.soft_bps) ? DivergenceBand::Soft : DivergenceBand::Stress;
    out.haircut_bps = haircut_bps(delta);
    out.next.active = true;
    out.next.healthy_streak = 0;
    return out;
}

} // namespace dnmm
