/**
 * @file token_bucket_pacer.cpp
 * @brief Implementation of token_bucket_pacer
 */

#include <hns_transfer/sender/token_bucket_pacer.h>

#include <algorithm>

namespace hns_transfer {

namespace {

// Upper bound of a single wait so cancellation is noticed promptly
constexpr auto max_wait_slice = std::chrono::milliseconds(50);

}  // namespace

token_bucket_pacer::token_bucket_pacer(uint64_t bytes_per_second)
    : bytes_per_second_(bytes_per_second)
    , tokens_(static_cast<double>(bytes_per_second))
    , capacity_(static_cast<double>(bytes_per_second))
    , last_refill_(std::chrono::steady_clock::now()) {}

token_bucket_pacer::~token_bucket_pacer() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

auto token_bucket_pacer::request(const operation_context& ctx, std::size_t bytes)
    -> result<void> {
    if (auto live = ctx.check(); !live) {
        return live;
    }
    if (bytes == 0 || bytes_per_second_.load(std::memory_order_relaxed) == 0) {
        return {};
    }

    std::unique_lock lock(mutex_);

    while (!stopping_) {
        if (bytes_per_second_.load(std::memory_order_relaxed) == 0) {
            return {};
        }

        refill_tokens();

        // Requests larger than the bucket go through once it is full and
        // leave the bucket in debt.
        double needed = std::min(static_cast<double>(bytes), capacity_);
        if (tokens_ >= needed) {
            tokens_ -= static_cast<double>(bytes);
            return {};
        }

        auto wait_time = std::min<std::chrono::microseconds>(
            calculate_wait_time(static_cast<std::size_t>(needed)), max_wait_slice);
        if (auto left = ctx.remaining()) {
            wait_time = std::min(wait_time,
                                 std::chrono::duration_cast<std::chrono::microseconds>(*left));
        }

        cv_.wait_for(lock, wait_time);

        if (auto live = ctx.check(); !live) {
            return live;
        }
    }
    return unexpected(error{error_code::operation_cancelled, "pacer is shutting down"});
}

auto token_bucket_pacer::bytes_per_second() const -> uint64_t {
    return bytes_per_second_.load(std::memory_order_relaxed);
}

auto token_bucket_pacer::try_request(std::size_t bytes) -> bool {
    if (bytes == 0 || bytes_per_second_.load(std::memory_order_relaxed) == 0) {
        return true;
    }

    std::lock_guard lock(mutex_);
    refill_tokens();

    if (tokens_ >= static_cast<double>(bytes)) {
        tokens_ -= static_cast<double>(bytes);
        return true;
    }
    return false;
}

void token_bucket_pacer::set_limit(uint64_t bytes_per_second) {
    std::lock_guard lock(mutex_);

    auto old_limit = bytes_per_second_.exchange(bytes_per_second);
    double new_capacity = static_cast<double>(bytes_per_second);

    // Scale existing tokens proportionally
    if (old_limit > 0 && capacity_ > 0) {
        tokens_ = std::min(tokens_ * (new_capacity / capacity_), new_capacity);
    } else {
        tokens_ = new_capacity;
    }
    capacity_ = new_capacity;
    last_refill_ = std::chrono::steady_clock::now();

    cv_.notify_all();
}

auto token_bucket_pacer::available_tokens() const -> uint64_t {
    std::lock_guard lock(mutex_);
    const_cast<token_bucket_pacer*>(this)->refill_tokens();
    return static_cast<uint64_t>(std::max(0.0, tokens_));
}

void token_bucket_pacer::refill_tokens() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration<double>(now - last_refill_);

    if (elapsed.count() > 0.0) {
        double rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
        tokens_ = std::min(tokens_ + elapsed.count() * rate, capacity_);
        last_refill_ = now;
    }
}

auto token_bucket_pacer::calculate_wait_time(std::size_t bytes) const
    -> std::chrono::microseconds {
    double needed = static_cast<double>(bytes) - tokens_;
    if (needed <= 0.0) {
        return std::chrono::microseconds::zero();
    }

    double rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
    if (rate <= 0.0) {
        return std::chrono::microseconds::zero();
    }

    return std::chrono::microseconds(static_cast<int64_t>(needed / rate * 1'000'000.0));
}

}  // namespace hns_transfer
