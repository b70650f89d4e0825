/**
 * @file path_service.h
 * @brief Remote path service interface
 *
 * The service performs the actual create/delete/get-properties requests
 * against a hierarchical-namespace store. Authentication, retries and the
 * wire format belong to the implementation.
 */

#ifndef HNS_TRANSFER_REMOTE_PATH_SERVICE_H
#define HNS_TRANSFER_REMOTE_PATH_SERVICE_H

#include <hns_transfer/core/operation_context.h>
#include <hns_transfer/core/transfer_types.h>
#include <hns_transfer/core/types.h>
#include <hns_transfer/remote/destination_url.h>
#include <hns_transfer/remote/path_headers.h>

#include <cstdint>

namespace hns_transfer {

/**
 * @brief Remote path service interface
 *
 * This interface allows for dependency injection of the storage client,
 * enabling mock implementations for testing. A missing path must be
 * reported as error_code::object_not_found.
 */
class path_service {
public:
    virtual ~path_service() = default;

    /**
     * @brief Create (or overwrite) a file or directory
     * @param ctx Operation context
     * @param url Path to create
     * @param kind File or directory
     * @param headers Content headers stored with the path
     * @param expected_length Final length of the file in bytes
     */
    [[nodiscard]] virtual auto create(
        const operation_context& ctx,
        const destination_url& url,
        entity_type kind,
        const path_http_headers& headers,
        uint64_t expected_length) -> result<void> = 0;

    /**
     * @brief Delete a file or directory
     */
    [[nodiscard]] virtual auto remove(
        const operation_context& ctx,
        const destination_url& url,
        entity_type kind) -> result<void> = 0;

    /**
     * @brief Get properties of a path
     */
    [[nodiscard]] virtual auto get_properties(
        const operation_context& ctx,
        const destination_url& url) -> result<path_properties> = 0;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_REMOTE_PATH_SERVICE_H
