// =============================================================================
// AutoPick - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Fallible operations (template loading, capture, recognition) return a
// Result; misses and lifecycle misuse are reported as empty values / false.
//
// Usage:
//   Result<Image> loadFrame(const std::string& path) {
//       if (path.empty()) return Err<Image>("empty path", ErrorCode::InvalidArgument);
//       return Ok(image);
//   }
// =============================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace autopick {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode {
    None = 0,
    Recognition,      // capture returned nothing usable; cycle skipped
    Actuation,        // click rejected or off-screen
    Configuration,    // unreadable template / config entry
    Io,               // file system access
    InvalidArgument
};

inline const char* errorCodeName(ErrorCode c) {
    switch (c) {
        case ErrorCode::None:            return "none";
        case ErrorCode::Recognition:     return "recognition";
        case ErrorCode::Actuation:       return "actuation";
        case ErrorCode::Configuration:   return "configuration";
        case ErrorCode::Io:              return "io";
        case ErrorCode::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

struct Error {
    std::string message;
    ErrorCode code = ErrorCode::None;

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::None)
        : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, ErrorCode c = ErrorCode::None)
        : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// IO error (template and frame files)
struct IoError : Error {
    enum class Kind { NotFound, PermissionDenied, Decode, Other };
    Kind kind = Kind::Other;

    IoError() = default;
    explicit IoError(std::string msg, Kind k = Kind::Other)
        : Error(std::move(msg), ErrorCode::Io), kind(k) {}
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, ErrorCode code = ErrorCode::None) {
    return Result<T, Error>(Error(std::move(message), code));
}

template<typename T>
Result<T, Error> Err(const char* message, ErrorCode code = ErrorCode::None) {
    return Result<T, Error>(Error(message, code));
}

} // namespace autopick
