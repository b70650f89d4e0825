/**
 * @file source_info_provider.h
 * @brief Source metadata provider interface
 */

#ifndef HNS_TRANSFER_SENDER_SOURCE_INFO_PROVIDER_H
#define HNS_TRANSFER_SENDER_SOURCE_INFO_PROVIDER_H

#include <hns_transfer/core/types.h>
#include <hns_transfer/remote/path_headers.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hns_transfer {

/**
 * @brief Metadata of a transfer source
 */
struct source_properties {
    std::string content_type;
    std::string content_encoding;
    std::string content_language;
    std::string content_disposition;
    std::string cache_control;
    std::vector<uint8_t> content_md5;

    /// Source size in bytes, if known
    std::optional<uint64_t> size;

    /// Last modification time, if known
    std::optional<std::chrono::system_clock::time_point> last_modified;

    /**
     * @brief Convert to the headers applied at remote creation
     */
    [[nodiscard]] auto to_path_http_headers() const -> path_http_headers {
        path_http_headers headers;
        headers.content_type = content_type;
        headers.content_encoding = content_encoding;
        headers.content_language = content_language;
        headers.content_disposition = content_disposition;
        headers.cache_control = cache_control;
        headers.content_md5 = content_md5;
        return headers;
    }
};

/**
 * @brief Provides metadata about a transfer source
 */
class source_info_provider {
public:
    virtual ~source_info_provider() = default;

    /**
     * @brief Fetch source properties
     * @return Properties, or metadata_fetch_failed
     */
    [[nodiscard]] virtual auto properties() const -> result<source_properties> = 0;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_SOURCE_INFO_PROVIDER_H
