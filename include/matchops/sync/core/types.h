/**
 * @file types.h
 * @brief Core type definitions for matchops_sync
 */

#ifndef MATCHOPS_SYNC_CORE_TYPES_H
#define MATCHOPS_SYNC_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace matchops::sync {

/**
 * @brief Error codes for lock, migration and checkpoint operations
 *
 * Error code ranges:
 * - -100 to -119: Lock Errors
 * - -120 to -159: Migration Errors
 * - -160 to -179: Checkpoint Errors
 * - -180 to -199: Storage Errors
 * - -200 to -219: Configuration / Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Lock errors (-100 to -119)
    lock_timeout = -100,

    // Migration errors (-120 to -159)
    item_transfer_error = -120,
    verification_mismatch = -121,
    fatal_transport_error = -122,
    transport_unavailable = -123,
    item_not_found = -124,
    migration_in_progress = -125,
    invalid_state_transition = -126,
    migration_not_found = -127,
    error_threshold_exceeded = -128,
    rate_limited = -129,
    not_supported = -130,

    // Checkpoint errors (-160 to -179)
    checkpoint_not_found = -160,
    checkpoint_corrupted = -161,
    checkpoint_unsupported_phase = -162,
    checkpoint_expired = -163,
    checkpoint_write_error = -164,
    checkpoint_read_error = -165,

    // Storage errors (-180 to -199)
    storage_read_error = -180,
    storage_write_error = -181,

    // Configuration / internal errors (-200 to -219)
    invalid_configuration = -200,
    internal_error = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::lock_timeout:
            return "lock timeout";
        case error_code::item_transfer_error:
            return "item transfer error";
        case error_code::verification_mismatch:
            return "verification mismatch";
        case error_code::fatal_transport_error:
            return "fatal transport error";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::item_not_found:
            return "item not found";
        case error_code::migration_in_progress:
            return "migration already in progress";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::migration_not_found:
            return "migration not found";
        case error_code::error_threshold_exceeded:
            return "item error threshold exceeded";
        case error_code::rate_limited:
            return "rate limited";
        case error_code::not_supported:
            return "not supported";
        case error_code::checkpoint_not_found:
            return "checkpoint not found";
        case error_code::checkpoint_corrupted:
            return "checkpoint corrupted";
        case error_code::checkpoint_unsupported_phase:
            return "checkpoint phase not supported";
        case error_code::checkpoint_expired:
            return "checkpoint expired";
        case error_code::checkpoint_write_error:
            return "checkpoint write error";
        case error_code::checkpoint_read_error:
            return "checkpoint read error";
        case error_code::storage_read_error:
            return "storage read error";
        case error_code::storage_write_error:
            return "storage write error";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if an error is a transient transport failure worth retrying
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return code == error_code::transport_unavailable;
}

/**
 * @brief Check if an error aborts a migration run
 */
[[nodiscard]] constexpr auto is_fatal(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::verification_mismatch:
        case error_code::fatal_transport_error:
        case error_code::error_threshold_exceeded:
        case error_code::checkpoint_write_error:
        case error_code::lock_timeout:
        case error_code::internal_error:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace matchops::sync

#endif  // MATCHOPS_SYNC_CORE_TYPES_H
