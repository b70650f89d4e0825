/**
 * @file transfer_context.h
 * @brief Transfer-status collaborator consumed by senders
 */

#ifndef HNS_TRANSFER_SENDER_TRANSFER_CONTEXT_H
#define HNS_TRANSFER_SENDER_TRANSFER_CONTEXT_H

#include <hns_transfer/core/logging.h>
#include <hns_transfer/core/operation_context.h>
#include <hns_transfer/core/transfer_types.h>
#include <hns_transfer/core/types.h>

#include <string_view>

namespace hns_transfer {

/**
 * @brief View of one transfer owned by the orchestrator
 *
 * Senders use it to learn about the transfer, to report fatal failures and
 * to log. Implementations must be thread-safe.
 */
class transfer_context {
public:
    virtual ~transfer_context() = default;

    /**
     * @brief Snapshot of the transfer's metadata
     */
    [[nodiscard]] virtual auto info() const -> const transfer_info& = 0;

    /**
     * @brief Operation context bound to the transfer's lifetime
     */
    [[nodiscard]] virtual auto context() const -> operation_context = 0;

    /**
     * @brief Current transfer status
     */
    [[nodiscard]] virtual auto status() const -> transfer_status = 0;

    /**
     * @brief Check if the transfer failed or was cancelled while in flight
     */
    [[nodiscard]] virtual auto is_dead_inflight() const -> bool = 0;

    /**
     * @brief Report a fatal failure of the active upload
     * @param stage Label of the failing stage (e.g. "Creating file")
     * @param err Underlying error
     */
    virtual void fail_active_upload(std::string_view stage, const error& err) = 0;

    /**
     * @brief Write a message to the transfer's log
     */
    virtual void log(log_level level, std::string_view message) = 0;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_TRANSFER_CONTEXT_H
