#pragma once

#include <string>
#include <utility>
#include <variant>

namespace tilemap {

enum class ErrorKind {
    Parse,          // text could not be read as the requested value
    InvalidCoords,  // components violate the coordinate system's constraint
    InvalidArgument,
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

/// Holds either a value of type T or an Error.
/// Used for operations whose failure is an ordinary, reportable outcome
/// (bad user input); expected absence uses std::optional / nullptr instead.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    T value_or(T fallback) const {
        return ok() ? std::get<T>(data_) : std::move(fallback);
    }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

} // namespace tilemap
