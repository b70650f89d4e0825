/**
 * @file transfer_tracker.cpp
 * @brief Implementation of transfer_tracker
 */

#include <hns_transfer/sender/transfer_tracker.h>

#include <atomic>
#include <mutex>
#include <utility>

namespace hns_transfer {

struct transfer_tracker::impl {
    transfer_info info;
    log_level min_level;
    cancellation_source cancel_source;
    std::atomic<transfer_status> status{transfer_status::started};

    mutable std::mutex failure_mutex;
    std::optional<std::string> failure_message;
    std::optional<error_code> failure_code;

    impl(transfer_info i, log_level level) : info(std::move(i)), min_level(level) {}

    // Moves status out of started; false if it was already terminal
    auto try_finish(transfer_status next) -> bool {
        auto expected = transfer_status::started;
        return status.compare_exchange_strong(expected, next, std::memory_order_acq_rel);
    }

    [[nodiscard]] auto log_context() const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.transfer_id = info.transfer_id;
        ctx.source = info.source;
        ctx.destination = info.destination;
        return ctx;
    }
};

transfer_tracker::transfer_tracker(transfer_info info, log_level min_level)
    : impl_(std::make_unique<impl>(std::move(info), min_level)) {}

transfer_tracker::~transfer_tracker() = default;

auto transfer_tracker::info() const -> const transfer_info& {
    return impl_->info;
}

auto transfer_tracker::context() const -> operation_context {
    return impl_->cancel_source.context();
}

auto transfer_tracker::status() const -> transfer_status {
    return impl_->status.load(std::memory_order_acquire);
}

auto transfer_tracker::is_dead_inflight() const -> bool {
    return is_dead_inflight_status(status());
}

void transfer_tracker::fail_active_upload(std::string_view stage, const error& err) {
    {
        std::lock_guard<std::mutex> lock(impl_->failure_mutex);
        if (!impl_->try_finish(transfer_status::failed)) {
            return;
        }
        impl_->failure_message = std::string(stage) + ": " + err.message;
        impl_->failure_code = err.code;
    }
    impl_->cancel_source.cancel();

    auto ctx = impl_->log_context();
    ctx.stage = std::string(stage);
    ctx.error_message = err.message;
    HT_LOG_ERROR_CTX(log_category::tracker, "transfer failed", ctx);
}

void transfer_tracker::log(log_level level, std::string_view message) {
    if (static_cast<int>(level) < static_cast<int>(impl_->min_level)) {
        return;
    }
    auto ctx = impl_->log_context();
    get_logger().log(level, log_category::tracker, message, &ctx);
}

auto transfer_tracker::cancel() -> bool {
    if (!impl_->try_finish(transfer_status::cancelled)) {
        return false;
    }
    impl_->cancel_source.cancel();

    auto ctx = impl_->log_context();
    HT_LOG_INFO_CTX(log_category::tracker, "transfer cancelled", ctx);
    return true;
}

auto transfer_tracker::mark_succeeded() -> bool {
    if (!impl_->try_finish(transfer_status::succeeded)) {
        return false;
    }

    auto ctx = impl_->log_context();
    HT_LOG_DEBUG_CTX(log_category::tracker, "transfer succeeded", ctx);
    return true;
}

auto transfer_tracker::failure_message() const -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(impl_->failure_mutex);
    return impl_->failure_message;
}

auto transfer_tracker::failure_code() const -> std::optional<error_code> {
    std::lock_guard<std::mutex> lock(impl_->failure_mutex);
    return impl_->failure_code;
}

}  // namespace hns_transfer
