/**
 * @file remote_target.cpp
 * @brief Implementation of remote_target and target resolution
 */

#include <hns_transfer/remote/remote_target.h>

#include <hns_transfer/core/logging.h>

#include <utility>

namespace hns_transfer {

remote_target::remote_target(target_kind kind,
                             destination_url url,
                             std::shared_ptr<path_service> service)
    : kind_(kind), url_(std::move(url)), service_(std::move(service)) {}

auto remote_target::service_kind() const noexcept -> entity_type {
    switch (kind_) {
        case target_kind::folder:
            return entity_type::folder;
        case target_kind::file:
        default:
            return entity_type::file;
    }
}

auto remote_target::entity_kind() const -> result<entity_type> {
    switch (kind_) {
        case target_kind::file:
            return entity_type::file;
        case target_kind::folder:
            return unexpected(error{error_code::unsupported_operation,
                                    "sending folders is not supported: " + to_string()});
        default:
            return unexpected(error{error_code::internal_error, "unknown target kind"});
    }
}

auto remote_target::create(const operation_context& ctx,
                           const path_http_headers& headers,
                           uint64_t expected_length) const -> result<void> {
    if (auto live = ctx.check(); !live) {
        return live;
    }
    return service_->create(ctx, url_, service_kind(), headers, expected_length);
}

auto remote_target::remove(const operation_context& ctx) const -> result<void> {
    if (auto live = ctx.check(); !live) {
        return live;
    }
    return service_->remove(ctx, url_, service_kind());
}

auto remote_target::get_properties(const operation_context& ctx) const
    -> result<path_properties> {
    if (auto live = ctx.check(); !live) {
        return unexpected(live.error());
    }
    return service_->get_properties(ctx, url_);
}

auto remote_target::to_string() const -> std::string {
    return url_.to_string();
}

auto resolve_target(std::string_view destination,
                    entity_type kind,
                    std::shared_ptr<path_service> service) -> result<remote_target> {
    if (!service) {
        return unexpected(error{error_code::invalid_configuration,
                                "remote path service must not be null"});
    }

    auto url = destination_url::parse(destination);
    if (!url) {
        HT_LOG_WARN(log_category::resolver, url.error().message);
        return unexpected(url.error());
    }

    auto tag = kind == entity_type::folder ? target_kind::folder : target_kind::file;
    HT_LOG_DEBUG(log_category::resolver,
                 "resolved " + std::string(hns_transfer::to_string(tag)) +
                     " target " + url.value().to_string());

    return remote_target(tag, std::move(url).value(), std::move(service));
}

}  // namespace hns_transfer
