/**
 * @file local_file_info_provider.h
 * @brief Source metadata for files on the local file system
 */

#ifndef HNS_TRANSFER_SENDER_LOCAL_FILE_INFO_PROVIDER_H
#define HNS_TRANSFER_SENDER_LOCAL_FILE_INFO_PROVIDER_H

#include <hns_transfer/sender/source_info_provider.h>

#include <filesystem>
#include <string>

namespace hns_transfer {

/**
 * @brief Detect MIME type from a file name's extension
 * @return MIME type, application/octet-stream if unknown
 */
[[nodiscard]] auto detect_content_type(const std::string& name) -> std::string;

/**
 * @brief Reads metadata of a local file
 *
 * A ".gz" suffix sets the content encoding to gzip; the content type then
 * comes from the extension before it ("data.json.gz" is application/json).
 */
class local_file_info_provider : public source_info_provider {
public:
    explicit local_file_info_provider(std::filesystem::path path);

    [[nodiscard]] auto properties() const -> result<source_properties> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_SENDER_LOCAL_FILE_INFO_PROVIDER_H
