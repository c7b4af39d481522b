#pragma once

#include <cstdint>

namespace dnmm {

using Timestamp   = uint64_t;   // seconds since epoch
using BlockNumber = uint64_t;
using Amount      = uint64_t;   // raw token units

constexpr double kBps = 10000.0;

enum class OracleMode : uint8_t { Spot, Strict };

// Closed set of price sources, in fallback priority order.
enum class OracleSource : uint8_t { Primary, EmaFallback, Secondary };

const char* to_string(OracleMode mode);
const char* to_string(OracleSource source);

// Regime bits carried by quotes and preview snapshots.
enum RegimeFlag : uint32_t {
    kRegimeAomq           = 1u << 0,
    kRegimeFallback       = 1u << 1,
    kRegimeNearFloor      = 1u << 2,
    kRegimeSizeFee        = 1u << 3,
    kRegimeInvTilt        = 1u << 4,
    kRegimeSoftDivergence = 1u << 5,
};

} // namespace dnmm
