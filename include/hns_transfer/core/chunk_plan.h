/**
 * @file chunk_plan.h
 * @brief Chunk planning for a single transfer
 */

#ifndef HNS_TRANSFER_CORE_CHUNK_PLAN_H
#define HNS_TRANSFER_CORE_CHUNK_PLAN_H

#include <hns_transfer/core/types.h>

#include <cstdint>

namespace hns_transfer {

/**
 * @brief Chunk size and count for a transfer
 *
 * Computed once when a sender is constructed and never re-derived.
 */
struct chunk_plan {
    /// Size of every chunk except possibly the last one
    uint32_t chunk_size = 0;

    /// Number of chunks (zero for an empty source)
    uint64_t num_chunks = 0;

    /**
     * @brief Byte offset of a chunk within the source
     * @param index Chunk index (0-based)
     */
    [[nodiscard]] auto chunk_offset(uint64_t index) const noexcept -> uint64_t {
        return index * static_cast<uint64_t>(chunk_size);
    }

    /**
     * @brief Byte length of a chunk
     * @param index Chunk index (0-based)
     * @param source_size Total source size in bytes
     * @return Chunk length, or error if index is out of range
     */
    [[nodiscard]] auto chunk_length(uint64_t index, uint64_t source_size) const
        -> result<uint64_t>;
};

/**
 * @brief Compute the chunk plan for a source
 *
 * The chunk size equals the requested block size. The chunk count is
 * ceil(source_size / block_size), and zero when the source is empty.
 *
 * @param source_size Source size in bytes
 * @param block_size Requested block size in bytes (must be > 0)
 * @return Chunk plan, or invalid_chunk_size if block_size is zero
 */
[[nodiscard]] auto plan_chunks(uint64_t source_size, uint32_t block_size)
    -> result<chunk_plan>;

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_CORE_CHUNK_PLAN_H
