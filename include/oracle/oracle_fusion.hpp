#pragma once

#include "config/pool_config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "oracle/oracle_feed.hpp"

#include <array>
#include <optional>

namespace dnmm {

struct OracleReading {
    double       mid        = 0.0;
    double       age_sec    = 0.0;
    double       spread_bps = 0.0;
    bool         has_spread = false;
    OracleSource source     = OracleSource::Primary;
};

enum class SourceStatus : uint8_t { Ok, Unset, Stale, Disabled };

struct SourceRead {
    SourceStatus  status   = SourceStatus::Unset;
    OracleReading reading;
    double        conf_bps = 0.0;   // secondary only
};

enum class FallbackReason : uint8_t { None, PrimaryStale, PrimaryUnset };

const char* to_string(FallbackReason reason);

struct ConfidenceInputs {
    double spread_bps    = 0.0;
    bool   has_spread    = false;
    double sigma_bps     = 0.0;
    double secondary_bps = 0.0;
    bool   has_secondary = false;
};

struct ReferencePrice {
    double         mid           = 0.0;
    double         conf_bps      = 0.0;
    bool           used_fallback = false;
    FallbackReason reason        = FallbackReason::None;
    double         primary_age_sec = 0.0;    // 0 when the primary is unset
    OracleReading  reading;                  // the reading that supplied the mid
    std::optional<OracleReading> secondary;  // fresh secondary, for divergence
    double         secondary_conf_bps = 0.0;
    double         spread_bps    = 0.0;      // observed spread, 0 when unknown
    ConfidenceInputs conf_inputs;            // reblend with a fresher sigma
};

class OracleFusion {
public:
    static constexpr std::array<OracleSource, 3> kPriority = {
        OracleSource::Primary, OracleSource::EmaFallback, OracleSource::Secondary};

    OracleFusion(OracleConfig config, const IOracleFeed& feed);

    // Walks the sources in priority order and returns the first usable mid.
    // Fails with OracleStale if some source had a price that was too old,
    // MidUnset if no source produced any price.
    Result<ReferencePrice> read_reference_price(OracleMode mode, double sigma_bps) const;

    SourceRead read_source(OracleSource source, OracleMode mode) const;

    // Weighted average of the available components, each capped first.
    double blend_confidence(const ConfidenceInputs& in, OracleMode mode) const;

    double conf_cap(OracleMode mode) const;
    double max_age_sec(OracleSource source, OracleMode mode) const;

private:
    OracleConfig       config_;
    const IOracleFeed* feed_;
};

} // namespace dnmm
