#include "core/result.hpp"

namespace dnmm {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MidUnset:                return "MidUnset";
        case ErrorCode::OracleStale:             return "OracleStale";
        case ErrorCode::DivergenceHard:          return "DivergenceHard";
        case ErrorCode::FloorBreach:             return "FloorBreach";
        case ErrorCode::RecenterCooldown:        return "RecenterCooldown";
        case ErrorCode::RecenterThreshold:       return "RecenterThreshold";
        case ErrorCode::PreviewSnapshotStale:    return "PreviewSnapshotStale";
        case ErrorCode::PreviewSnapshotCooldown: return "PreviewSnapshotCooldown";
        case ErrorCode::InvalidConfig:           return "InvalidConfig";
        case ErrorCode::DeadlineExpired:         return "DeadlineExpired";
        case ErrorCode::SlippageExceeded:        return "SlippageExceeded";
        case ErrorCode::ZeroAmount:              return "ZeroAmount";
    }
    return "Unknown";
}

} // namespace dnmm
