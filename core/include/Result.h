#pragma once

/**
 * @file Result.h
 * @brief Error handling types for Signet
 *
 * Operations that can fail return Result<T> instead of throwing. The error
 * carries a code from the taxonomy below and a message meant for the caller;
 * messages never contain key material.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace Signet {

/**
 * @brief Error codes for Signet operations
 */
enum class ErrorCode {
    Success = 0,

    // Input errors (100-199)
    InvalidInput = 100,
    InvalidDuration = 101,
    UnsupportedAlgorithm = 102,

    // Registry errors (200-299)
    AlreadyExists = 200,
    NotFound = 201,
    EmptyRing = 202,

    // Crypto errors (300-399)
    GenerationFailed = 300,
    SigningFailed = 301,
    SerializationFailed = 302,

    // Identity errors (400-499)
    UnresolvedIdentity = 400,

    // Storage errors (500-599)
    StorageError = 500,

    // General errors (900-999)
    Cancelled = 900,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidInput: return "Invalid input";
        case ErrorCode::InvalidDuration: return "Invalid duration";
        case ErrorCode::UnsupportedAlgorithm: return "Unsupported algorithm";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::EmptyRing: return "Key ring is empty";
        case ErrorCode::GenerationFailed: return "Key generation failed";
        case ErrorCode::SigningFailed: return "Signing failed";
        case ErrorCode::SerializationFailed: return "Serialization failed";
        case ErrorCode::UnresolvedIdentity: return "Unresolved identity";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }

    std::string toString() const {
        return std::string(errorCodeToString(code)) + ": " + message;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * @code
 * Result<Duration> parsed = parseDuration("6h");
 * if (!parsed) {
 *     return parsed.error();
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(E error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Throws std::bad_variant_access if this holds an error
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace Signet
