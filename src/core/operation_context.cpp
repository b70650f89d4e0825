/**
 * @file operation_context.cpp
 * @brief Implementation of operation_context and cancellation_source
 */

#include <hns_transfer/core/operation_context.h>

#include <algorithm>
#include <utility>

namespace hns_transfer {

operation_context::operation_context(
    std::shared_ptr<const std::atomic<bool>> cancelled,
    std::optional<clock::time_point> deadline)
    : cancelled_(std::move(cancelled)), deadline_(deadline) {}

auto operation_context::background() -> operation_context {
    return operation_context(nullptr, std::nullopt);
}

auto operation_context::with_timeout(clock::duration timeout) const -> operation_context {
    return with_deadline(clock::now() + timeout);
}

auto operation_context::with_deadline(clock::time_point deadline) const -> operation_context {
    if (deadline_.has_value()) {
        deadline = std::min(deadline, *deadline_);
    }
    return operation_context(cancelled_, deadline);
}

auto operation_context::is_cancelled() const noexcept -> bool {
    return cancelled_ && cancelled_->load(std::memory_order_acquire);
}

auto operation_context::is_expired() const -> bool {
    return deadline_.has_value() && clock::now() >= *deadline_;
}

auto operation_context::is_done() const -> bool {
    return is_cancelled() || is_expired();
}

auto operation_context::deadline() const noexcept -> std::optional<clock::time_point> {
    return deadline_;
}

auto operation_context::remaining() const -> std::optional<clock::duration> {
    if (!deadline_.has_value()) {
        return std::nullopt;
    }
    auto left = *deadline_ - clock::now();
    return std::max(left, clock::duration::zero());
}

auto operation_context::check() const -> result<void> {
    if (is_cancelled()) {
        return unexpected(error{error_code::operation_cancelled});
    }
    if (is_expired()) {
        return unexpected(error{error_code::deadline_exceeded});
    }
    return {};
}

auto operation_context::shares_cancellation_with(const operation_context& other) const noexcept
    -> bool {
    return cancelled_ != nullptr && cancelled_ == other.cancelled_;
}

cancellation_source::cancellation_source()
    : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

void cancellation_source::cancel() noexcept {
    if (cancelled_) {
        cancelled_->store(true, std::memory_order_release);
    }
}

auto cancellation_source::is_cancelled() const noexcept -> bool {
    return cancelled_ && cancelled_->load(std::memory_order_acquire);
}

auto cancellation_source::context() const -> operation_context {
    return operation_context(cancelled_, std::nullopt);
}

}  // namespace hns_transfer
