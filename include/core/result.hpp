#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace dnmm {

enum class ErrorCode : uint8_t {
    MidUnset,                // no source produced any price
    OracleStale,             // a source produced a price but it was too old
    DivergenceHard,
    FloorBreach,
    RecenterCooldown,
    RecenterThreshold,
    PreviewSnapshotStale,
    PreviewSnapshotCooldown,
    InvalidConfig,
    DeadlineExpired,
    SlippageExceeded,
    ZeroAmount,
};

const char* to_string(ErrorCode code);

struct Error {
    ErrorCode   code   = ErrorCode::MidUnset;
    std::string detail;
    double      value  = 0.0;   // offending measurement (age, delta, amount)
    double      limit  = 0.0;   // bound it was checked against
};

inline Error make_error(ErrorCode code, std::string detail = {},
                        double value = 0.0, double limit = 0.0) {
    return Error{.code = code, .detail = std::move(detail), .value = value, .limit = limit};
}

// Either a value or a typed Error. Callers must check ok() before value().
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) throw std::logic_error(std::string("Result holds error: ") + to_string(error().code));
        return std::get<T>(data_);
    }
    T& value() {
        if (!ok()) throw std::logic_error(std::string("Result holds error: ") + to_string(error().code));
        return std::get<T>(data_);
    }

    const T& operator*() const { return value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const {
        if (ok()) throw std::logic_error("Result holds a value");
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        if (ok()) throw std::logic_error("Result holds no error");
        return *error_;
    }

private:
    std::optional<Error> error_;
};

} // namespace dnmm
