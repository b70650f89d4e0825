/**
 * @file operation_context.h
 * @brief Cancellation and deadline propagation for remote operations
 *
 * Every remote call made by a sender receives an operation_context. A
 * transfer owns one cancellation_source; its context is shared by create,
 * append and verification calls. Best-effort cleanup uses a context derived
 * from background() instead, so cancelling the transfer never aborts it.
 *
 * @code
 * cancellation_source transfer_cancel;
 * auto transfer_ctx = transfer_cancel.context();
 *
 * // Cleanup context: independent of transfer_cancel, bounded at 2 minutes
 * auto cleanup_ctx = operation_context::background().with_timeout(std::chrono::minutes(2));
 *
 * transfer_cancel.cancel();
 * // transfer_ctx.is_cancelled() == true, cleanup_ctx.is_cancelled() == false
 * @endcode
 */

#ifndef HNS_TRANSFER_CORE_OPERATION_CONTEXT_H
#define HNS_TRANSFER_CORE_OPERATION_CONTEXT_H

#include <hns_transfer/core/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace hns_transfer {

class cancellation_source;

/**
 * @brief Cancellation token with an optional deadline
 *
 * Copies share cancellation state. Cheap to copy and safe to query
 * concurrently.
 */
class operation_context {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @brief Context that is never cancelled and has no deadline
     */
    [[nodiscard]] static auto background() -> operation_context;

    /**
     * @brief Derive a context that also expires after a timeout
     *
     * The derived context keeps this context's cancellation state. If this
     * context already has an earlier deadline, that deadline is kept.
     */
    [[nodiscard]] auto with_timeout(clock::duration timeout) const -> operation_context;

    /**
     * @brief Derive a context that also expires at a point in time
     */
    [[nodiscard]] auto with_deadline(clock::time_point deadline) const -> operation_context;

    /**
     * @brief Check if the owning cancellation_source was cancelled
     */
    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /**
     * @brief Check if the deadline (if any) has passed
     */
    [[nodiscard]] auto is_expired() const -> bool;

    /**
     * @brief Check if the context is cancelled or expired
     */
    [[nodiscard]] auto is_done() const -> bool;

    /**
     * @brief Get the deadline, if one is set
     */
    [[nodiscard]] auto deadline() const noexcept -> std::optional<clock::time_point>;

    /**
     * @brief Get the time left before the deadline
     * @return Remaining time (zero once expired), or nullopt if no deadline
     */
    [[nodiscard]] auto remaining() const -> std::optional<clock::duration>;

    /**
     * @brief Report why the context is done
     * @return Success if still live, operation_cancelled or deadline_exceeded otherwise
     */
    [[nodiscard]] auto check() const -> result<void>;

    /**
     * @brief Check if two contexts observe the same cancellation source
     */
    [[nodiscard]] auto shares_cancellation_with(const operation_context& other) const noexcept
        -> bool;

private:
    friend class cancellation_source;

    operation_context(std::shared_ptr<const std::atomic<bool>> cancelled,
                      std::optional<clock::time_point> deadline);

    std::shared_ptr<const std::atomic<bool>> cancelled_;
    std::optional<clock::time_point> deadline_;
};

/**
 * @brief Owner of a cancellation flag
 *
 * Non-copyable; contexts obtained from it stay valid after it is destroyed.
 */
class cancellation_source {
public:
    cancellation_source();
    ~cancellation_source() = default;

    cancellation_source(const cancellation_source&) = delete;
    auto operator=(const cancellation_source&) -> cancellation_source& = delete;
    cancellation_source(cancellation_source&&) noexcept = default;
    auto operator=(cancellation_source&&) noexcept -> cancellation_source& = default;

    /**
     * @brief Cancel every context obtained from this source
     */
    void cancel() noexcept;

    /**
     * @brief Check if cancel() was called
     */
    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /**
     * @brief Get a context bound to this source (no deadline)
     */
    [[nodiscard]] auto context() const -> operation_context;

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_CORE_OPERATION_CONTEXT_H
