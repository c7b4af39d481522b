#include "oracle/oracle_fusion.hpp"

#include <algorithm>
#include <utility>

namespace dnmm {

const char* to_string(FallbackReason reason) {
    switch (reason) {
        case FallbackReason::None:         return "none";
        case FallbackReason::PrimaryStale: return "primary_stale";
        case FallbackReason::PrimaryUnset: return "primary_unset";
    }
    return "unknown";
}

OracleFusion::OracleFusion(OracleConfig config, const IOracleFeed& feed)
    : config_(std::move(config)), feed_(&feed) {}

double OracleFusion::conf_cap(OracleMode mode) const {
    return mode == OracleMode::Strict ? config_.conf_cap_bps_strict : config_.conf_cap_bps_spot;
}

double OracleFusion::max_age_sec(OracleSource source, OracleMode mode) const {
    if (source != OracleSource::Secondary) return config_.max_age_sec;
    return mode == OracleMode::Strict ? config_.secondary_max_age_sec_strict
                                      : config_.secondary_max_age_sec;
}

SourceRead OracleFusion::read_source(OracleSource source, OracleMode mode) const {
    SourceRead out;
    out.reading.source = source;

    switch (source) {
        case OracleSource::Primary: {
            auto r = feed_->read_mid_and_age();
            if (!r.ok || r.mid <= 0.0) return out;
            out.reading.mid = r.mid;
            out.reading.age_sec = r.age_sec;
            if (r.age_sec > max_age_sec(source, mode)) {
                out.status = SourceStatus::Stale;
                return out;
            }
            auto ba = feed_->read_bid_ask();
            if (ba.ok && ba.bid > 0.0 && ba.ask >= ba.bid) {
                out.reading.spread_bps = (ba.ask - ba.bid) / r.mid * kBps;
                out.reading.has_spread = true;
            }
            out.status = SourceStatus::Ok;
            return out;
        }
        case OracleSource::EmaFallback: {
            if (!config_.allow_ema_fallback) {
                out.status = SourceStatus::Disabled;
                return out;
            }
            auto r = feed_->read_ema_fallback();
            if (!r.ok || r.mid <= 0.0) return out;
            out.reading.mid = r.mid;
            out.status = SourceStatus::Ok;
            return out;
        }
        case OracleSource::Secondary: {
            auto r = feed_->read_secondary_mid();
            if (!r.ok || r.mid <= 0.0) return out;
            out.reading.mid = r.mid;
            out.reading.age_sec = r.age_sec;
            out.conf_bps = r.conf_bps;
            out.status = (r.age_sec > max_age_sec(source, mode)) ? SourceStatus::Stale
                                                                 : SourceStatus::Ok;
            return out;
        }
    }
    return out;
}

Result<ReferencePrice> OracleFusion::read_reference_price(OracleMode mode, double sigma_bps) const {
    SourceRead primary = read_source(OracleSource::Primary, mode);
    SourceRead secondary = read_source(OracleSource::Secondary, mode);

    bool saw_stale = false;
    std::optional<SourceRead> chosen;
    for (OracleSource source : kPriority) {
        SourceRead read = (source == OracleSource::Primary)   ? primary
                        : (source == OracleSource::Secondary) ? secondary
                                                              : read_source(source, mode);
        if (read.status == SourceStatus::Ok) {
            chosen = read;
            break;
        }
        if (read.status == SourceStatus::Stale) saw_stale = true;
    }

    if (!chosen) {
        if (saw_stale) {
            const SourceRead& stale = primary.status == SourceStatus::Stale ? primary : secondary;
            return make_error(ErrorCode::OracleStale, "all sources stale or unset",
                              stale.reading.age_sec, max_age_sec(stale.reading.source, mode));
        }
        return make_error(ErrorCode::MidUnset, "no oracle source produced a price");
    }

    ReferencePrice ref;
    ref.mid = chosen->reading.mid;
    ref.reading = chosen->reading;
    ref.used_fallback = chosen->reading.source != OracleSource::Primary;
    ref.primary_age_sec = primary.reading.age_sec;
    if (ref.used_fallback) {
        ref.reason = primary.status == SourceStatus::Stale ? FallbackReason::PrimaryStale
                                                           : FallbackReason::PrimaryUnset;
    }
    if (secondary.status == SourceStatus::Ok) {
        ref.secondary = secondary.reading;
        ref.secondary_conf_bps = secondary.conf_bps;
    }
    if (chosen->reading.has_spread) {
        ref.spread_bps = chosen->reading.spread_bps;
    }

    ConfidenceInputs in{
        .spread_bps    = ref.used_fallback ? conf_cap(mode) : ref.spread_bps,
        .has_spread    = ref.used_fallback || chosen->reading.has_spread,
        .sigma_bps     = sigma_bps,
        .secondary_bps = ref.secondary_conf_bps,
        .has_secondary = ref.secondary.has_value(),
    };
    ref.conf_inputs = in;
    ref.conf_bps = blend_confidence(in, mode);
    return ref;
}

double OracleFusion::blend_confidence(const ConfidenceInputs& in, OracleMode mode) const {
    double cap = conf_cap(mode);
    double weighted = 0.0;
    double weights = 0.0;

    if (in.has_spread) {
        weighted += config_.conf_weight_spread_bps * std::min(in.spread_bps, cap);
        weights += config_.conf_weight_spread_bps;
    }
    weighted += config_.conf_weight_sigma_bps * std::min(in.sigma_bps, cap);
    weights += config_.conf_weight_sigma_bps;
    if (in.has_secondary) {
        weighted += config_.conf_weight_secondary_bps * std::min(in.secondary_bps, cap);
        weights += config_.conf_weight_secondary_bps;
    }

    if (weights <= 0.0) return 0.0;
    return std::min(weighted / weights, cap);
}

} // namespace dnmm
