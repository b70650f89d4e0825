/**
 * @file pacer.h
 * @brief Rate limiter interface handed to chunk operations
 */

#ifndef HNS_TRANSFER_SENDER_PACER_H
#define HNS_TRANSFER_SENDER_PACER_H

#include <hns_transfer/core/operation_context.h>
#include <hns_transfer/core/types.h>

#include <cstddef>
#include <cstdint>

namespace hns_transfer {

/**
 * @brief Shared bandwidth limiter
 *
 * Senders only carry the pacer; chunk operations call request() before
 * sending bytes.
 */
class pacer {
public:
    virtual ~pacer() = default;

    /**
     * @brief Block until @p bytes may be sent
     * @return Success, or the context's error if it is done first
     */
    [[nodiscard]] virtual auto request(const operation_context& ctx, std::size_t bytes)
        -> result<void> = 0;

    /**
     * @brief Configured rate (0 = unlimited)
     */
    [[nodiscard]] virtual auto bytes_per_second() const -> uint64_t = 0;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_PACER_H
