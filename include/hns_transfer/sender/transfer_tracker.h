/**
 * @file transfer_tracker.h
 * @brief Thread-safe transfer_context for a single transfer
 */

#ifndef HNS_TRANSFER_SENDER_TRANSFER_TRACKER_H
#define HNS_TRANSFER_SENDER_TRANSFER_TRACKER_H

#include <hns_transfer/sender/transfer_context.h>

#include <memory>
#include <optional>
#include <string>

namespace hns_transfer {

/**
 * @brief Tracks the status of one transfer
 *
 * Status moves from started to exactly one of succeeded, failed or
 * cancelled and never changes afterwards. The first reported failure wins.
 *
 * @code
 * auto tracker = std::make_shared<transfer_tracker>(info);
 * auto sender = datalake_sender::create(tracker, source, service, nullptr);
 * ...
 * tracker->cancel();              // user abort
 * sender.value()->cleanup();      // deletes the partial file
 * @endcode
 */
class transfer_tracker : public transfer_context {
public:
    explicit transfer_tracker(transfer_info info, log_level min_level = log_level::info);
    ~transfer_tracker() override;

    transfer_tracker(const transfer_tracker&) = delete;
    auto operator=(const transfer_tracker&) -> transfer_tracker& = delete;

    [[nodiscard]] auto info() const -> const transfer_info& override;
    [[nodiscard]] auto context() const -> operation_context override;
    [[nodiscard]] auto status() const -> transfer_status override;
    [[nodiscard]] auto is_dead_inflight() const -> bool override;

    void fail_active_upload(std::string_view stage, const error& err) override;
    void log(log_level level, std::string_view message) override;

    /**
     * @brief Cancel the transfer
     * @return true if the transfer was still in flight
     */
    auto cancel() -> bool;

    /**
     * @brief Mark the transfer as succeeded
     * @return true if the transfer was still in flight
     */
    auto mark_succeeded() -> bool;

    /**
     * @brief Failure recorded by fail_active_upload, as "<stage>: <message>"
     */
    [[nodiscard]] auto failure_message() const -> std::optional<std::string>;

    /**
     * @brief Error code of the recorded failure
     */
    [[nodiscard]] auto failure_code() const -> std::optional<error_code>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_TRANSFER_TRACKER_H
