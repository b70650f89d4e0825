/**
 * @file remote_target.h
 * @brief Immutable reference to a remote file or directory
 */

#ifndef HNS_TRANSFER_REMOTE_REMOTE_TARGET_H
#define HNS_TRANSFER_REMOTE_REMOTE_TARGET_H

#include <hns_transfer/remote/path_service.h>

#include <memory>
#include <string>
#include <string_view>

namespace hns_transfer {

/**
 * @brief Kind tag of a remote target
 */
enum class target_kind {
    file,
    folder,
};

[[nodiscard]] constexpr auto to_string(target_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case target_kind::file:
            return "file";
        case target_kind::folder:
            return "folder";
        default:
            return "unknown";
    }
}

/**
 * @brief Handle to a file or a folder in the remote namespace
 *
 * The kind is fixed at resolution and every operation dispatches on it.
 * Copies share the underlying service.
 */
class remote_target {
public:
    [[nodiscard]] auto kind() const noexcept -> target_kind { return kind_; }
    [[nodiscard]] auto url() const -> const destination_url& { return url_; }

    /**
     * @brief Entity type this target can receive
     * @return entity_type::file for file targets, unsupported_operation for folders
     */
    [[nodiscard]] auto entity_kind() const -> result<entity_type>;

    /**
     * @brief Create the remote path
     */
    [[nodiscard]] auto create(const operation_context& ctx,
                              const path_http_headers& headers,
                              uint64_t expected_length) const -> result<void>;

    /**
     * @brief Delete the remote path
     */
    [[nodiscard]] auto remove(const operation_context& ctx) const -> result<void>;

    /**
     * @brief Fetch properties of the remote path
     */
    [[nodiscard]] auto get_properties(const operation_context& ctx) const
        -> result<path_properties>;

    /**
     * @brief Stable identity string (canonical URL)
     */
    [[nodiscard]] auto to_string() const -> std::string;

private:
    friend auto resolve_target(std::string_view destination,
                               entity_type kind,
                               std::shared_ptr<path_service> service)
        -> result<remote_target>;

    remote_target(target_kind kind, destination_url url, std::shared_ptr<path_service> service);

    [[nodiscard]] auto service_kind() const noexcept -> entity_type;

    target_kind kind_;
    destination_url url_;
    std::shared_ptr<path_service> service_;
};

/**
 * @brief Resolve a destination into a file or folder target
 *
 * Makes no remote call. Resolving the same inputs twice yields targets with
 * the same kind and identity string.
 *
 * @param destination Destination URL
 * @param kind Declared entity kind of the transfer
 * @param service Remote path service (must not be null)
 * @return Target, or malformed_destination / invalid_configuration
 */
[[nodiscard]] auto resolve_target(std::string_view destination,
                                  entity_type kind,
                                  std::shared_ptr<path_service> service)
    -> result<remote_target>;

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_REMOTE_REMOTE_TARGET_H
