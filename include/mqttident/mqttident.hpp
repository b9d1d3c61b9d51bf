#pragma once

/**
 * @file mqttident.hpp
 * @brief mqttident - deterministic MQTT client identity
 *
 * Core types shared by every part of the library: error codes, the Result
 * type, device facts and the constants that make up the identifier scheme.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace mqttident {

/// Library version
constexpr const char* VERSION = "1.0.2";

/// Default upper bound for generated client identifiers (MQTT 3.1 limit)
constexpr int DEFAULT_MAX_CLIENT_ID_LENGTH = 23;

/// Smallest max_length accepted by the identifier composer
constexpr int MIN_CLIENT_ID_LENGTH = 8;

/// Separator between seed components; never part of the component alphabet
constexpr char SEED_SEPARATOR = '\x1f';

/// Token namespace of the client identifier scheme (bump the suffix to migrate)
constexpr const char* CLIENT_ID_NAMESPACE = "mqtt-client.v1";

/// Error codes returned by library operations
enum class ErrorCode {
    Success = 0,

    // Identity input errors
    InvalidComponent,
    InvalidConfiguration,
    InvalidInput,

    // Hashing errors
    DigestError,

    // Configuration loading errors
    ParseError,
    FileError,
    FileNotFound,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::InvalidComponent:
            return "Invalid identity component";
        case ErrorCode::InvalidConfiguration:
            return "Invalid configuration";
        case ErrorCode::InvalidInput:
            return "Invalid input";
        case ErrorCode::DigestError:
            return "Digest error";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::FileError:
            return "File error";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Re-type the error of another result
    template <typename U> static Result propagate(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Connection kinds understood by the fact probe
namespace connection_kind {
constexpr const char* MAC = "mac";
constexpr const char* BLUETOOTH = "bluetooth";
}  // namespace connection_kind

/**
 * @brief A hardware address observed on the device
 *
 * After normalization `kind` is "mac" or "bluetooth" and `address` is a
 * lowercase colon-separated MAC ("aa:bb:cc:dd:ee:ff").
 */
struct Connection {
    std::string kind;
    std::string address;

    friend bool operator<(const Connection& a, const Connection& b) {
        return std::tie(a.kind, a.address) < std::tie(b.kind, b.address);
    }
    friend bool operator==(const Connection& a, const Connection& b) {
        return a.kind == b.kind && a.address == b.address;
    }
    friend bool operator!=(const Connection& a, const Connection& b) { return !(a == b); }
};

/**
 * @brief Raw device facts collected by the fact probe
 *
 * Connection order carries no meaning; the fingerprint resolver orders them.
 */
struct DeviceFacts {
    std::optional<std::string> serial_number;
    std::vector<Connection> connections;
};

}  // namespace mqttident
