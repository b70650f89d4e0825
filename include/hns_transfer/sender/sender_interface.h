/**
 * @file sender_interface.h
 * @brief Abstract base of all senders
 */

#ifndef HNS_TRANSFER_SENDER_SENDER_INTERFACE_H
#define HNS_TRANSFER_SENDER_SENDER_INTERFACE_H

#include <hns_transfer/core/transfer_types.h>
#include <hns_transfer/core/types.h>

#include <cstdint>
#include <optional>

namespace hns_transfer {

/**
 * @brief Result of a prologue
 */
struct prologue_outcome {
    /// True once a remote object may exist; cleanup must then run
    bool destination_modified = false;

    /// Set when the prologue failed
    std::optional<hns_transfer::error> error;
};

/**
 * @brief Lifecycle contract shared by every sender
 *
 * The orchestrator calls prologue() once before scheduling chunk
 * operations, and cleanup() once after every chunk operation is terminal.
 */
class sender_interface {
public:
    virtual ~sender_interface() = default;

    [[nodiscard]] virtual auto chunk_size() const -> uint32_t = 0;
    [[nodiscard]] virtual auto num_chunks() const -> uint64_t = 0;

    /**
     * @brief Entity type this sender can send
     */
    [[nodiscard]] virtual auto sendable_entity_type() const -> result<entity_type> = 0;

    /**
     * @brief Check whether the destination already exists
     */
    [[nodiscard]] virtual auto remote_file_exists() -> result<bool> = 0;

    /**
     * @brief Prepare the destination before any chunk is sent
     */
    virtual auto prologue() -> prologue_outcome = 0;

    /**
     * @brief Finish the transfer, removing partial output on failure
     */
    virtual void cleanup() = 0;

    /**
     * @brief Length of the destination as seen by the service
     */
    [[nodiscard]] virtual auto get_destination_length() -> result<uint64_t> = 0;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_SENDER_INTERFACE_H
