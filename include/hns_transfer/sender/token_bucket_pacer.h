/**
 * @file token_bucket_pacer.h
 * @brief Token bucket implementation of pacer
 */

#ifndef HNS_TRANSFER_SENDER_TOKEN_BUCKET_PACER_H
#define HNS_TRANSFER_SENDER_TOKEN_BUCKET_PACER_H

#include <hns_transfer/sender/pacer.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hns_transfer {

/**
 * @brief Pacer limiting throughput with a token bucket
 *
 * The bucket holds one second worth of tokens and starts full. A rate of
 * zero disables limiting. Waiting is interrupted when the caller's context
 * is cancelled or expires.
 *
 * @code
 * auto shared = std::make_shared<token_bucket_pacer>(10 * 1024 * 1024);  // 10 MB/s
 * if (auto ok = shared->request(ctx, chunk_length); !ok) {
 *     // ctx was cancelled while waiting
 * }
 * @endcode
 */
class token_bucket_pacer : public pacer {
public:
    explicit token_bucket_pacer(uint64_t bytes_per_second);
    ~token_bucket_pacer() override;

    token_bucket_pacer(const token_bucket_pacer&) = delete;
    auto operator=(const token_bucket_pacer&) -> token_bucket_pacer& = delete;

    [[nodiscard]] auto request(const operation_context& ctx, std::size_t bytes)
        -> result<void> override;

    [[nodiscard]] auto bytes_per_second() const -> uint64_t override;

    /**
     * @brief Take tokens without waiting
     * @return true if the tokens were available
     */
    [[nodiscard]] auto try_request(std::size_t bytes) -> bool;

    /**
     * @brief Change the rate (0 = unlimited)
     */
    void set_limit(uint64_t bytes_per_second);

    /**
     * @brief Bytes that may be sent right now
     */
    [[nodiscard]] auto available_tokens() const -> uint64_t;

private:
    void refill_tokens();

    [[nodiscard]] auto calculate_wait_time(std::size_t bytes) const
        -> std::chrono::microseconds;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> bytes_per_second_;
    bool stopping_ = false;

    // Token bucket state
    double tokens_;
    double capacity_;
    std::chrono::steady_clock::time_point last_refill_;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_TOKEN_BUCKET_PACER_H
