#include "core/types.hpp"

namespace dnmm {

const char* to_string(OracleMode mode) {
    switch (mode) {
        case OracleMode::Spot:   return "spot";
        case OracleMode::Strict: return "strict";
    }
    return "unknown";
}

const char* to_string(OracleSource source) {
    switch (source) {
        case OracleSource::Primary:     return "primary";
        case OracleSource::EmaFallback: return "ema_fallback";
        case OracleSource::Secondary:   return "secondary";
    }
    return "unknown";
}

} // namespace dnmm
