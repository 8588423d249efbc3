// =============================================================================
// Mirador - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Used on every public operation of the session core instead of exceptions.
//
// Usage:
//   Result<std::vector<uint8_t>, SessionError> fetch() {
//       if (!ok) return Err<std::vector<uint8_t>>(SessionError::deployment("fetch failed"));
//       return Ok(std::move(buffer));
//   }
//
//   auto result = fetch();
//   if (result.is_err()) {
//       MLOG_ERROR("tag", "%s", result.error().message.c_str());
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace mirador {

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

// Session lifecycle error (start/stop/negotiation/teardown)
struct SessionError : Error {
    enum class Kind {
        Deployment,          // server fetch or push failed
        Negotiation,         // encoder probe failed or returned nothing
        DecoderUnavailable,  // no decoder selected, or decoder could not be created
        Protocol,            // reported by the scrcpy client
        InvalidState,        // operation not allowed in the current state
        Cancelled            // stop() requested while start() was in flight
    };
    Kind kind = Kind::Protocol;

    SessionError() = default;
    explicit SessionError(Kind k, std::string msg)
        : Error(std::move(msg), static_cast<int>(k)), kind(k) {}

    static SessionError deployment(std::string msg) { return SessionError(Kind::Deployment, std::move(msg)); }
    static SessionError negotiation(std::string msg) { return SessionError(Kind::Negotiation, std::move(msg)); }
    static SessionError decoderUnavailable(std::string msg) { return SessionError(Kind::DecoderUnavailable, std::move(msg)); }
    static SessionError protocol(std::string msg) { return SessionError(Kind::Protocol, std::move(msg)); }
    static SessionError invalidState(std::string msg) { return SessionError(Kind::InvalidState, std::move(msg)); }
    static SessionError cancelled(std::string msg) { return SessionError(Kind::Cancelled, std::move(msg)); }
};

inline const char* kindName(SessionError::Kind k) {
    switch (k) {
        case SessionError::Kind::Deployment:         return "DeploymentError";
        case SessionError::Kind::Negotiation:        return "NegotiationError";
        case SessionError::Kind::DecoderUnavailable: return "DecoderUnavailableError";
        case SessionError::Kind::Protocol:           return "ProtocolError";
        case SessionError::Kind::InvalidState:       return "InvalidStateError";
        case SessionError::Kind::Cancelled:          return "CancelledError";
    }
    return "UnknownError";
}

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

    // Check status
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

    // Safe access with default
    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    // Optional-style access
    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    // Map error, keeping the success value
    template<typename F>
    auto map_err(F&& f) const& -> Result<T, decltype(f(std::declval<E>()))> {
        using U = decltype(f(std::declval<E>()));
        if (is_err()) return Result<T, U>(f(std::get<1>(data_)));
        return Result<T, U>(std::get<0>(data_));
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
    // Success constructor
    Result() : data_(std::monostate{}) {}

    // Error constructor
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

// Create success result
template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

// Create void success
inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

// Create error result
template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, int code = 0) {
    return Result<T, Error>(Error(std::move(message), code));
}

template<typename T>
Result<T, Error> Err(const char* message, int code = 0) {
    return Result<T, Error>(Error(message, code));
}

} // namespace mirador
