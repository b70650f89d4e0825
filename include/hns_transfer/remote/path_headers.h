/**
 * @file path_headers.h
 * @brief Content headers and properties of a remote path
 */

#ifndef HNS_TRANSFER_REMOTE_PATH_HEADERS_H
#define HNS_TRANSFER_REMOTE_PATH_HEADERS_H

#include <hns_transfer/core/transfer_types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hns_transfer {

/**
 * @brief HTTP content headers applied when a path is created
 */
struct path_http_headers {
    std::string content_type;
    std::string content_encoding;
    std::string content_language;
    std::string content_disposition;
    std::string cache_control;

    /// Raw MD5 digest of the whole source (empty if unknown)
    std::vector<uint8_t> content_md5;

    auto operator==(const path_http_headers&) const -> bool = default;
};

/**
 * @brief Result of a get-properties call on a remote path
 */
struct path_properties {
    /// Content length in bytes (zero for directories)
    uint64_t content_length = 0;

    /// Content headers stored with the path
    path_http_headers headers;

    /// ETag
    std::string etag;

    /// Last modified time
    std::optional<std::chrono::system_clock::time_point> last_modified;

    /// Resource kind reported by the service
    entity_type resource = entity_type::file;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_REMOTE_PATH_HEADERS_H
