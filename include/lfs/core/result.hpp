#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace lfs {

/**
 * @brief Coarse classification of everything that can go wrong in the engine
 *
 * Callers branch on the kind (e.g. retry a Network failure at a higher level,
 * surface a Config failure to the operator) and log the message.
 */
enum class ErrorKind {
    InvalidArgument,      // Construction / precondition failure
    InvalidState,         // Operation not allowed in the current state
    Network,              // Transport failure or non-2xx reply
    MalformedResponse,    // Remote answered but the payload is unusable
    FatalProtocol,        // Remote rejected the request; retrying cannot help
    RetryBudgetExhausted, // Too many transient failures
    DecryptionFailed,
    Config,
    Io
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::InvalidState: return "invalid_state";
        case ErrorKind::Network: return "network";
        case ErrorKind::MalformedResponse: return "malformed_response";
        case ErrorKind::FatalProtocol: return "fatal_protocol";
        case ErrorKind::RetryBudgetExhausted: return "retry_budget_exhausted";
        case ErrorKind::DecryptionFailed: return "decryption_failed";
        case ErrorKind::Config: return "config";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::InvalidState;
    std::string message;

    std::string describe() const {
        return std::string(to_string(kind)) + ": " + message;
    }
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }

    // Re-wraps the error of a failed result for a different success type.
    template<typename U>
    Result<U, E> propagate() const {
        return Result<U, E>(ErrValue<E>(error()));
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error{kind, std::move(message)}));
}

} // namespace lfs
