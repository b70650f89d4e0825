/**
 * @file datalake_sender.cpp
 * @brief Implementation of datalake_sender
 */

#include <hns_transfer/sender/datalake_sender.h>

#include <utility>

namespace hns_transfer {

namespace {

constexpr std::string_view creating_file_stage = "Creating file";

}  // namespace

auto datalake_sender::create(std::shared_ptr<transfer_context> transfer,
                             const source_info_provider& source,
                             std::shared_ptr<path_service> service,
                             std::shared_ptr<hns_transfer::pacer> rate_limiter,
                             sender_config config)
    -> result<std::unique_ptr<datalake_sender>> {
    if (!transfer) {
        return unexpected(error{error_code::invalid_configuration,
                                "transfer context must not be null"});
    }
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    const auto& info = transfer->info();

    auto target = resolve_target(info.destination, info.entity, std::move(service));
    if (!target) {
        return unexpected(target.error());
    }

    auto plan = plan_chunks(info.source_size, info.block_size);
    if (!plan) {
        HT_LOG_WARN(log_category::planner, plan.error().message);
        return unexpected(plan.error());
    }

    auto props = source.properties();
    if (!props) {
        auto message = "fetching source properties of " + info.source + ": " +
                       props.error().message;
        HT_LOG_WARN(log_category::source, message);
        return unexpected(error{error_code::metadata_fetch_failed, std::move(message)});
    }

    std::unique_ptr<datalake_sender> sender(new datalake_sender(
        std::move(transfer), std::move(target).value(), plan.value(),
        props.value().to_path_http_headers(), std::move(rate_limiter), config));

    auto ctx = sender->log_context();
    HT_LOG_DEBUG_CTX(log_category::sender, "sender created", ctx);
    return sender;
}

datalake_sender::datalake_sender(std::shared_ptr<transfer_context> transfer,
                                 remote_target target,
                                 chunk_plan plan,
                                 path_http_headers headers,
                                 std::shared_ptr<hns_transfer::pacer> rate_limiter,
                                 sender_config config)
    : transfer_(std::move(transfer))
    , target_(std::move(target))
    , plan_(plan)
    , headers_(std::move(headers))
    , pacer_(std::move(rate_limiter))
    , config_(config) {}

auto datalake_sender::chunk_size() const -> uint32_t {
    return plan_.chunk_size;
}

auto datalake_sender::num_chunks() const -> uint64_t {
    return plan_.num_chunks;
}

auto datalake_sender::sendable_entity_type() const -> result<entity_type> {
    return target_.entity_kind();
}

auto datalake_sender::remote_file_exists() -> result<bool> {
    auto props = target_.get_properties(transfer_->context());
    if (!props) {
        if (props.error().code == error_code::object_not_found) {
            return false;
        }
        return unexpected(props.error());
    }
    return true;
}

auto datalake_sender::prologue() -> prologue_outcome {
    auto expected = phase::constructed;
    if (!phase_.compare_exchange_strong(expected, phase::prologued,
                                        std::memory_order_acq_rel)) {
        return {false, error{error_code::invalid_state,
                             "prologue already ran for " + target_.to_string()}};
    }

    flush_threshold_.store(static_cast<uint64_t>(plan_.chunk_size) *
                               config_.flush_threshold_multiplier,
                           std::memory_order_release);

    auto ctx = log_context();
    ctx.stage = std::string(creating_file_stage);
    HT_LOG_DEBUG_CTX(log_category::prologue, "creating destination", ctx);

    auto created = target_.create(transfer_->context(), headers_,
                                  transfer_->info().source_size);
    if (!created) {
        transfer_->fail_active_upload(creating_file_stage, created.error());
        return {true, created.error()};
    }
    return {true, std::nullopt};
}

void datalake_sender::cleanup() {
    if (phase_.exchange(phase::cleaned_up, std::memory_order_acq_rel) == phase::cleaned_up) {
        return;
    }

    if (!transfer_->is_dead_inflight()) {
        return;
    }

    // Independent of the transfer's cancellation, which has usually fired by now
    auto ctx = operation_context::background().with_timeout(config_.cleanup_timeout);

    auto removed = target_.remove(ctx);
    if (!removed) {
        transfer_->log(log_level::error,
                       "error deleting the (incomplete) file " + target_.to_string() +
                           ". Failed with error " + removed.error().message);
        return;
    }

    auto log_ctx = log_context();
    HT_LOG_DEBUG_CTX(log_category::cleanup, "deleted incomplete destination", log_ctx);
}

auto datalake_sender::get_destination_length() -> result<uint64_t> {
    auto props = target_.get_properties(transfer_->context());
    if (!props) {
        return unexpected(props.error());
    }
    return props.value().content_length;
}

auto datalake_sender::flush_threshold() const -> result<uint64_t> {
    auto threshold = flush_threshold_.load(std::memory_order_acquire);
    if (threshold == 0) {
        return unexpected(error{error_code::invalid_state,
                                "flush threshold is not known before prologue"});
    }
    return threshold;
}

auto datalake_sender::state() const -> sender_state {
    switch (phase_.load(std::memory_order_acquire)) {
        case phase::constructed:
            return sender_state::constructed;
        case phase::cleaned_up:
            return sender_state::cleaned_up;
        case phase::prologued:
        default:
            break;
    }

    auto status = transfer_->status();
    if (status == transfer_status::succeeded) {
        return sender_state::succeeded;
    }
    if (is_dead_inflight_status(status)) {
        return sender_state::failed;
    }
    return sender_state::prologued;
}

auto datalake_sender::log_context() const -> transfer_log_context {
    const auto& info = transfer_->info();
    transfer_log_context ctx;
    ctx.transfer_id = info.transfer_id;
    ctx.source = info.source;
    ctx.destination = target_.to_string();
    ctx.source_size = info.source_size;
    ctx.chunk_size = plan_.chunk_size;
    ctx.num_chunks = plan_.num_chunks;
    return ctx;
}

}  // namespace hns_transfer
