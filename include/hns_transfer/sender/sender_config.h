/**
 * @file sender_config.h
 * @brief Configuration of a hierarchical-namespace sender
 */

#ifndef HNS_TRANSFER_SENDER_SENDER_CONFIG_H
#define HNS_TRANSFER_SENDER_SENDER_CONFIG_H

#include <hns_transfer/core/types.h>

#include <chrono>
#include <cstdint>

namespace hns_transfer {

/**
 * @brief Sender policy values
 */
struct sender_config {
    /// Flush threshold is chunk_size * flush_threshold_multiplier
    uint32_t flush_threshold_multiplier = 7500;

    /// Deadline of the delete issued by cleanup
    std::chrono::milliseconds cleanup_timeout{std::chrono::minutes(2)};

    /**
     * @brief Validate configuration
     * @return Success, or invalid_configuration
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (flush_threshold_multiplier == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "flush_threshold_multiplier must be greater than zero"});
        }
        if (cleanup_timeout <= std::chrono::milliseconds::zero()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "cleanup_timeout must be positive"});
        }
        return {};
    }
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_SENDER_CONFIG_H
