/**
 * @file transfer_types.h
 * @brief Transfer-related data structures for hns_transfer
 *
 * This file defines the entity kinds, transfer status values and the
 * per-transfer information snapshot handed to senders.
 */

#ifndef HNS_TRANSFER_CORE_TRANSFER_TYPES_H
#define HNS_TRANSFER_CORE_TRANSFER_TYPES_H

#include <cstdint>
#include <string>
#include <string_view>

namespace hns_transfer {

/**
 * @brief Kind of entity a transfer moves
 */
enum class entity_type {
    file,
    folder,
};

[[nodiscard]] constexpr auto to_string(entity_type type) noexcept
    -> std::string_view {
    switch (type) {
        case entity_type::file:
            return "file";
        case entity_type::folder:
            return "folder";
        default:
            return "unknown";
    }
}

/**
 * @brief Transfer status as seen by the orchestrator
 */
enum class transfer_status {
    started,    // Scheduled or in flight
    succeeded,  // All chunks committed
    failed,     // A fatal failure was reported
    cancelled,  // Cancelled by the user or the job
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept
    -> std::string_view {
    switch (status) {
        case transfer_status::started:
            return "started";
        case transfer_status::succeeded:
            return "succeeded";
        case transfer_status::failed:
            return "failed";
        case transfer_status::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

/**
 * @brief Check if status means the transfer died while in flight
 */
[[nodiscard]] constexpr auto is_dead_inflight_status(transfer_status status) noexcept
    -> bool {
    return status == transfer_status::failed ||
           status == transfer_status::cancelled;
}

/**
 * @brief Snapshot of a single transfer's metadata
 */
struct transfer_info {
    /// Transfer identifier (used for logging)
    std::string transfer_id;

    /// Source path or URL
    std::string source;

    /// Destination URL
    std::string destination;

    /// Source size in bytes
    uint64_t source_size = 0;

    /// Requested block size in bytes
    uint32_t block_size = 0;

    /// Declared entity kind
    entity_type entity = entity_type::file;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_CORE_TRANSFER_TYPES_H
