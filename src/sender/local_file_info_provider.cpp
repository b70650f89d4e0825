/**
 * @file local_file_info_provider.cpp
 * @brief Implementation of local_file_info_provider
 */

#include <hns_transfer/sender/local_file_info_provider.h>

#include <hns_transfer/core/logging.h>

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace hns_transfer {

namespace {

auto lower_extension(const std::string& name) -> std::string {
    auto dot_pos = name.rfind('.');
    auto sep_pos = name.find_last_of("/\\");
    if (dot_pos == std::string::npos ||
        (sep_pos != std::string::npos && dot_pos < sep_pos)) {
        return {};
    }

    std::string ext = name.substr(dot_pos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

auto to_system_time(std::filesystem::file_time_type ftime)
    -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() +
        std::chrono::system_clock::now());
}

}  // namespace

auto detect_content_type(const std::string& name) -> std::string {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".parquet", "application/vnd.apache.parquet"},
        {".avro", "application/avro"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
    };

    auto it = mime_types.find(lower_extension(name));
    if (it != mime_types.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

local_file_info_provider::local_file_info_provider(std::filesystem::path path)
    : path_(std::move(path)) {}

auto local_file_info_provider::properties() const -> result<source_properties> {
    std::error_code ec;
    auto status = std::filesystem::status(path_, ec);
    if (ec || !std::filesystem::exists(status)) {
        return unexpected(error{error_code::metadata_fetch_failed,
                                "source not found: " + path_.string()});
    }
    if (!std::filesystem::is_regular_file(status)) {
        return unexpected(error{error_code::metadata_fetch_failed,
                                "source is not a regular file: " + path_.string()});
    }

    auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return unexpected(error{error_code::metadata_fetch_failed,
                                "cannot read size of " + path_.string() + ": " + ec.message()});
    }

    auto mtime = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return unexpected(error{error_code::metadata_fetch_failed,
                                "cannot read modification time of " + path_.string() + ": " +
                                    ec.message()});
    }

    source_properties props;
    props.size = size;
    props.last_modified = to_system_time(mtime);

    auto name = path_.filename().string();
    if (lower_extension(name) == ".gz") {
        props.content_encoding = "gzip";
        name = name.substr(0, name.size() - 3);
    }
    props.content_type = detect_content_type(name);

    HT_LOG_DEBUG(log_category::source,
                 "source " + path_.string() + " (" + props.content_type + ", " +
                     std::to_string(size) + " bytes)");
    return props;
}

}  // namespace hns_transfer
