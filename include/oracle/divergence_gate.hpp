#pragma once

#include "config/pool_config.hpp"
#include "core/result.hpp"

#include <cstdint>

namespace dnmm {

struct SoftDivergenceState {
    bool     active         = false;
    uint32_t healthy_streak = 0;
    double   last_delta_bps = 0.0;
};

enum class DivergenceBand : uint8_t {
    Accept,    // at or below accept
    Soft,      // (accept, soft]
    Stress,    // (soft, hard]
    NoSignal,  // no independent secondary to compare against
};

const char* to_string(DivergenceBand band);

struct DivergenceOutcome {
    DivergenceBand      band        = DivergenceBand::NoSignal;
    double              delta_bps   = 0.0;
    double              haircut_bps = 0.0;
    SoftDivergenceState next;
};

class DivergenceGate {
public:
    explicit DivergenceGate(DivergenceConfig config, bool soft_enabled = true);

    // Symmetric deviation (max - min) / max in bps.
    static double delta_bps(double a, double b);

    // Classifies the deviation and computes the next hysteresis state without
    // touching the current one. Fails with DivergenceHard past the hard band.
    Result<DivergenceOutcome> evaluate(double primary_mid, double secondary_mid,
                                       const SoftDivergenceState& current) const;

    // Outcome when no secondary reading is available: state carried over.
    DivergenceOutcome no_signal(const SoftDivergenceState& current) const;

    double haircut_bps(double delta_bps) const;

private:
    DivergenceConfig config_;
    bool             soft_enabled_;
};

} // namespace dnmm
