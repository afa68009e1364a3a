// =============================================================================
// Tether - Result Type for Unified Error Handling
// =============================================================================
// Caller-invoked operations return Result<T> (or Result<void>) instead of
// throwing. Background tasks convert failures into log lines and events.
//
// Usage:
//   Result<int> parsePort(const std::string& s) {
//       if (s.empty()) return Err<int>(ErrorKind::ValidationError, "empty port");
//       return Ok(std::stoi(s));
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace tether {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    Other = 0,
    ToolUnavailable,       // adb / scrcpy missing or not executable
    LaunchError,           // spawn failed
    TeardownFailed,        // child survived SIGKILL
    ExternalConflict,      // another mirroring instance is running
    ValidationError,       // bad config value
    SessionAlreadyActive,  // orchestrator already owns a session
    AlreadyRunning,        // handle already started
    Timeout,
    IoError
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Other:                return "Other";
        case ErrorKind::ToolUnavailable:      return "ToolUnavailable";
        case ErrorKind::LaunchError:          return "LaunchError";
        case ErrorKind::TeardownFailed:       return "TeardownFailed";
        case ErrorKind::ExternalConflict:     return "ExternalConflict";
        case ErrorKind::ValidationError:      return "ValidationError";
        case ErrorKind::SessionAlreadyActive: return "SessionAlreadyActive";
        case ErrorKind::AlreadyRunning:       return "AlreadyRunning";
        case ErrorKind::Timeout:              return "Timeout";
        case ErrorKind::IoError:              return "IoError";
    }
    return "Unknown";
}

// Error with kind, message and optional OS code (errno)
struct Error {
    ErrorKind kind = ErrorKind::Other;
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }

    std::string describe() const {
        return std::string(errorKindName(kind)) + ": " + message;
    }
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

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
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

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
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

template<typename T>
Result<T, Error> Err(Error error) {
    return Result<T, Error>(std::move(error));
}

template<typename T>
Result<T, Error> Err(ErrorKind kind, std::string message, int code = 0) {
    return Result<T, Error>(Error(kind, std::move(message), code));
}

// =============================================================================
// Macros for Early Return
// =============================================================================

// Unwrap result or return its error (GCC/Clang statement expression)
// Usage: auto value = TETHER_TRY(some_function());
#define TETHER_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

// Propagate the error of a Result<void>
#define TETHER_TRY_VOID(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
    } while (0)

#define TETHER_TRY_OR(expr, default_val) \
    ((expr).value_or(default_val))

} // namespace tether
