// =============================================================================
// AutoScene - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that carries either a success value or an error.
// Used on every fallible I/O / parsing path (scenario files, templates,
// frames). Programming-contract violations are exceptions instead.
//
// Usage:
//   Result<Scenario> r = loadScenarioFromFile("scenario.json");
//   if (r.is_err()) { ALOG_ERROR("main", "%s", r.error().message.c_str()); }
// =============================================================================

#pragma once

#include <utility>
#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace autoscene {

// =============================================================================
// Error Types
// =============================================================================

// Generic error with message
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// IO error (file read, image decode)
struct IoError : Error {
    enum class Kind {
        NotFound,
        DecodeFailed,
        Other
    };
    Kind kind = Kind::Other;

    IoError() = default;
    explicit IoError(std::string msg, Kind k = Kind::Other)
        : Error(std::move(msg), static_cast<int>(k)), kind(k) {}
};

// Scenario definition error (bad JSON, broken references, invalid codes)
struct ScenarioError : Error {
    enum class Kind {
        Parse,
        InvalidValue,
        UnknownReference
    };
    Kind kind = Kind::InvalidValue;

    ScenarioError() = default;
    explicit ScenarioError(std::string msg, Kind k = Kind::InvalidValue)
        : Error(std::move(msg), static_cast<int>(k)), kind(k) {}
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
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

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
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

template<typename T>
Result<T, Error> Err(std::string message, int code = 0) {
    return Result<T, Error>(Error(std::move(message), code));
}

template<typename T>
Result<T, Error> Err(const char* message, int code = 0) {
    return Result<T, Error>(Error(message, code));
}

} // namespace autoscene
