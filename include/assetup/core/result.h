#pragma once

#include <optional>
#include <utility>

#include "assetup/core/error.h"

namespace assetup::core {

/// @brief Value-or-Error carrier returned by every upload pipeline stage.
///
/// Exceptions never cross a module boundary; network and filesystem failures
/// are converted into an Error close to where they happen.
template <typename T>
class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    const T& value() const { return value_.value(); }
    T& value() { return value_.value(); }
    /// @brief Moves the value out; only valid when ok().
    T take() { return std::move(value_.value()); }
    const Error& error() const { return error_; }

private:
    std::optional<T> value_;
    Error error_;
};

template <>
class Result<void> {
public:
    Result() : ok_(true) {}
    Result(const Error& error) : ok_(false), error_(error) {}
    Result(Error&& error) : ok_(false), error_(std::move(error)) {}

    bool ok() const { return ok_; }
    const Error& error() const { return error_; }

private:
    bool ok_{false};
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

/// @brief Builds an Error value in one expression.
inline Error MakeError(ErrorCode code, std::string message, int http_status = 0,
                       int chunk_index = 0) {
    return Error{code, std::move(message), http_status, chunk_index};
}

}  // namespace assetup::core
