/**
 * @file datalake_sender.h
 * @brief Sender for hierarchical-namespace (data lake) destinations
 *
 * The sender creates the destination file before any chunk is appended
 * and deletes it again when the transfer dies in flight.
 *
 * @code
 * auto tracker = std::make_shared<transfer_tracker>(info);
 * local_file_info_provider source(info.source);
 *
 * auto sender = datalake_sender::create(tracker, source, service, pacer);
 * if (!sender) {
 *     return sender.error();
 * }
 *
 * auto outcome = sender.value()->prologue();
 * if (!outcome.error) {
 *     // schedule sender.value()->num_chunks() appends ...
 * }
 * sender.value()->cleanup();
 * @endcode
 */

#ifndef HNS_TRANSFER_SENDER_DATALAKE_SENDER_H
#define HNS_TRANSFER_SENDER_DATALAKE_SENDER_H

#include <hns_transfer/core/chunk_plan.h>
#include <hns_transfer/remote/remote_target.h>
#include <hns_transfer/sender/pacer.h>
#include <hns_transfer/sender/sender_config.h>
#include <hns_transfer/sender/sender_interface.h>
#include <hns_transfer/sender/source_info_provider.h>
#include <hns_transfer/sender/transfer_context.h>

#include <atomic>
#include <memory>
#include <string_view>

namespace hns_transfer {

/**
 * @brief Observable lifecycle state of a sender
 */
enum class sender_state {
    constructed,  // Created, prologue not yet run
    prologued,    // Destination created (or attempted), transfer in flight
    succeeded,    // Transfer reported success
    failed,       // Transfer failed or was cancelled
    cleaned_up,   // Cleanup ran
};

[[nodiscard]] constexpr auto to_string(sender_state state) noexcept -> std::string_view {
    switch (state) {
        case sender_state::constructed:
            return "constructed";
        case sender_state::prologued:
            return "prologued";
        case sender_state::succeeded:
            return "succeeded";
        case sender_state::failed:
            return "failed";
        case sender_state::cleaned_up:
            return "cleaned_up";
        default:
            return "unknown";
    }
}

/**
 * @brief Sender for one transfer into a data lake file
 *
 * Not copyable. Mutable state is atomic; the orchestrator orders
 * prologue, chunk appends and cleanup.
 */
class datalake_sender : public sender_interface {
public:
    /**
     * @brief Create a sender
     *
     * Resolves the destination, plans the chunks and snapshots the source's
     * content headers. Makes no remote call.
     *
     * @param transfer Transfer-status collaborator (must not be null)
     * @param source Source metadata provider
     * @param service Remote path service (must not be null)
     * @param rate_limiter Pacer handed to chunk operations (may be null)
     * @param config Sender policy
     * @return Sender, or malformed_destination, invalid_chunk_size,
     *         metadata_fetch_failed, invalid_configuration
     */
    [[nodiscard]] static auto create(std::shared_ptr<transfer_context> transfer,
                                     const source_info_provider& source,
                                     std::shared_ptr<path_service> service,
                                     std::shared_ptr<hns_transfer::pacer> rate_limiter,
                                     sender_config config = {})
        -> result<std::unique_ptr<datalake_sender>>;

    ~datalake_sender() override = default;

    datalake_sender(const datalake_sender&) = delete;
    auto operator=(const datalake_sender&) -> datalake_sender& = delete;

    [[nodiscard]] auto chunk_size() const -> uint32_t override;
    [[nodiscard]] auto num_chunks() const -> uint64_t override;
    [[nodiscard]] auto sendable_entity_type() const -> result<entity_type> override;
    [[nodiscard]] auto remote_file_exists() -> result<bool> override;

    /**
     * @brief Create the destination file
     *
     * Computes the flush threshold, then creates the file sized to the
     * source with the snapshotted headers. destination_modified is true
     * even when creation fails. A failure is also reported to the
     * transfer with stage "Creating file". A second call returns
     * invalid_state and does nothing.
     */
    auto prologue() -> prologue_outcome override;

    /**
     * @brief Delete the destination if the transfer died in flight
     *
     * The delete runs under its own deadline (config cleanup_timeout) and
     * is not affected by the transfer's cancellation. A failed delete is
     * logged at error level. Only the first call does anything.
     */
    void cleanup() override;

    [[nodiscard]] auto get_destination_length() -> result<uint64_t> override;

    /**
     * @brief Bytes appended between flushes
     * @return chunk_size * flush_threshold_multiplier, or invalid_state before prologue
     */
    [[nodiscard]] auto flush_threshold() const -> result<uint64_t>;

    [[nodiscard]] auto state() const -> sender_state;
    [[nodiscard]] auto plan() const -> const chunk_plan& { return plan_; }
    [[nodiscard]] auto creation_headers() const -> const path_http_headers& { return headers_; }
    [[nodiscard]] auto target() const -> const remote_target& { return target_; }
    [[nodiscard]] auto pacer() const -> std::shared_ptr<hns_transfer::pacer> { return pacer_; }
    [[nodiscard]] auto config() const -> const sender_config& { return config_; }

private:
    enum class phase {
        constructed,
        prologued,
        cleaned_up,
    };

    datalake_sender(std::shared_ptr<transfer_context> transfer,
                    remote_target target,
                    chunk_plan plan,
                    path_http_headers headers,
                    std::shared_ptr<hns_transfer::pacer> rate_limiter,
                    sender_config config);

    [[nodiscard]] auto log_context() const -> transfer_log_context;

    std::shared_ptr<transfer_context> transfer_;
    remote_target target_;
    chunk_plan plan_;
    path_http_headers headers_;
    std::shared_ptr<hns_transfer::pacer> pacer_;
    sender_config config_;

    std::atomic<phase> phase_{phase::constructed};

    // Zero until prologue ran
    std::atomic<uint64_t> flush_threshold_{0};
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_DATALAKE_SENDER_H
