/**
 * @file chunk_plan.cpp
 * @brief Implementation of chunk planning
 */

#include <hns_transfer/core/chunk_plan.h>

#include <algorithm>
#include <string>

namespace hns_transfer {

auto chunk_plan::chunk_length(uint64_t index, uint64_t source_size) const
    -> result<uint64_t> {
    if (index >= num_chunks) {
        return unexpected(error{
            error_code::invalid_chunk_index,
            "chunk index " + std::to_string(index) + " out of range (chunks: " +
                std::to_string(num_chunks) + ")"});
    }

    uint64_t offset = chunk_offset(index);
    return std::min<uint64_t>(chunk_size, source_size - offset);
}

auto plan_chunks(uint64_t source_size, uint32_t block_size) -> result<chunk_plan> {
    if (block_size == 0) {
        return unexpected(error{error_code::invalid_chunk_size,
                                "block size must be greater than zero"});
    }

    chunk_plan plan;
    plan.chunk_size = block_size;

    // An empty source has no chunks at all
    if (source_size == 0) {
        plan.num_chunks = 0;
        return plan;
    }

    plan.num_chunks = source_size / block_size;
    if (source_size % block_size != 0) {
        ++plan.num_chunks;
    }
    return plan;
}

}  // namespace hns_transfer
