/**
 * @file types.h
 * @brief Core type definitions for hns_transfer
 */

#ifndef HNS_TRANSFER_CORE_TYPES_H
#define HNS_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace hns_transfer {

/**
 * @brief Error codes for sender operations
 *
 * Error code ranges:
 * - -100 to -119: Destination errors
 * - -120 to -139: Chunk planning errors
 * - -140 to -159: Configuration errors
 * - -160 to -179: Remote object errors
 * - -180 to -199: Source errors
 * - -200 to -219: Lifecycle and context errors
 */
enum class error_code {
    success = 0,

    // Destination errors (-100 to -119)
    malformed_destination = -100,

    // Chunk planning errors (-120 to -139)
    invalid_chunk_size = -120,
    invalid_chunk_index = -121,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,

    // Remote object errors (-160 to -179)
    object_not_found = -160,
    object_already_exists = -161,
    remote_request_failed = -162,
    access_denied = -163,
    unsupported_operation = -164,

    // Source errors (-180 to -199)
    metadata_fetch_failed = -180,

    // Lifecycle and context errors (-200 to -219)
    internal_error = -200,
    invalid_state = -201,
    operation_cancelled = -202,
    deadline_exceeded = -203,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::malformed_destination:
            return "malformed destination";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_chunk_index:
            return "invalid chunk index";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::object_not_found:
            return "object not found";
        case error_code::object_already_exists:
            return "object already exists";
        case error_code::remote_request_failed:
            return "remote request failed";
        case error_code::access_denied:
            return "access denied";
        case error_code::unsupported_operation:
            return "unsupported operation";
        case error_code::metadata_fetch_failed:
            return "source metadata fetch failed";
        case error_code::internal_error:
            return "internal error";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::operation_cancelled:
            return "operation cancelled";
        case error_code::deadline_exceeded:
            return "deadline exceeded";
        default:
            return "unknown error";
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

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_CORE_TYPES_H
