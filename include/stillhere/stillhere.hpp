#pragma once

/**
 * @file stillhere.hpp
 * @brief stillhere dead man's switch registry
 *
 * Common types shared by every stillhere component: error codes, the
 * Error exception, the Result type, timestamps and the process Config.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace stillhere {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// UNIX timestamp in seconds (UTC)
using UnixSeconds = int64_t;

/// Source of "now" for handlers and the poller (injectable for tests)
using Clock = std::function<UnixSeconds()>;

/// Current UNIX time in seconds (UTC)
[[nodiscard]] inline UnixSeconds unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// System clock used when no clock is injected
[[nodiscard]] inline Clock system_clock() {
    return []() { return unix_now(); };
}

/// Error kinds raised by the core and mapped to status codes by the HTTP boundary
enum class ErrorCode {
    Success = 0,

    // Lookup errors
    NotFound,

    // Input errors
    InvalidArgument,
    InvalidMessageType,

    // Wiring errors
    InitializationError,
    ConfigurationError,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InvalidMessageType:
            return "Invalid message type";
        case ErrorCode::InitializationError:
            return "Initialization error";
        case ErrorCode::ConfigurationError:
            return "Configuration error";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Exception raised by command handlers, the unit of work and the bus
 *
 * Carries a closed ErrorCode so callers can decide how to report the failure
 * without inspecting the message text.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    /// Get the error code
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

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

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/**
 * @brief Configuration for the stillhere server process
 */
struct Config {
    /// Address the HTTP API binds to
    std::string host = "0.0.0.0";

    /// Port the HTTP API listens on
    int port = 8000;

    /// Interval between expiry poller ticks in seconds
    int poll_interval_seconds = 10;

    /// Minimum log level ("trace", "debug", "info", "warning", "error")
    std::string log_level = "info";

    /// Append log lines to this file instead of stderr (empty = console)
    std::string log_file;

    /// Identifier recorded on devices fired by this process (derived if empty)
    std::string consumer_id;

    // ========== Debug Settings ==========

    /// Enable debug logging
    bool debug = false;
};

}  // namespace stillhere
