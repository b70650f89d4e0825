/**
 * @file destination_url.h
 * @brief Parsing of hierarchical-namespace destination URLs
 */

#ifndef HNS_TRANSFER_REMOTE_DESTINATION_URL_H
#define HNS_TRANSFER_REMOTE_DESTINATION_URL_H

#include <hns_transfer/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hns_transfer {

/**
 * @brief Parsed destination of the form
 *        scheme://host[:port]/filesystem[/path...][?query][#fragment]
 *
 * The host may be a bracketed IPv6 literal. An empty port ("host:") means
 * no port. The fragment is dropped. The query string is kept verbatim
 * since it may carry a SAS token.
 *
 * @code
 * auto url = destination_url::parse(
 *     "https://acct.dfs.core.windows.net/fs/dir/file.bin?sv=2020&sig=abc");
 * if (url) {
 *     // url.value().filesystem() == "fs"
 *     // url.value().path() == "dir/file.bin"
 * }
 * @endcode
 */
class destination_url {
public:
    /**
     * @brief Parse a destination string
     *
     * Empty path segments are discarded, so "fs//dir/" and "fs/dir" parse
     * to the same path(). See to_string() for the resulting identity.
     *
     * @return Parsed URL, or malformed_destination
     */
    [[nodiscard]] static auto parse(std::string_view text) -> result<destination_url>;

    [[nodiscard]] auto scheme() const -> const std::string& { return scheme_; }
    [[nodiscard]] auto host() const -> const std::string& { return host_; }
    [[nodiscard]] auto port() const -> std::optional<uint16_t> { return port_; }

    /// File system (container) name, empty when the URL names the account root
    [[nodiscard]] auto filesystem() const -> const std::string& { return filesystem_; }

    /// Path inside the file system, without a leading slash
    [[nodiscard]] auto path() const -> const std::string& { return path_; }

    /// Query string without the leading '?'
    [[nodiscard]] auto query() const -> const std::string& { return query_; }

    /**
     * @brief Canonical form, used as the target's identity string
     *
     * Scheme and host are lower-cased. Runs of '/' in the path collapse to
     * one and a trailing '/' is dropped. An empty port and the fragment are
     * omitted. The result can therefore differ from the text passed to
     * parse(); parsing it again yields an equal URL.
     */
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const destination_url&) const -> bool = default;

private:
    destination_url() = default;

    std::string scheme_;
    std::string host_;
    std::optional<uint16_t> port_;
    std::string filesystem_;
    std::string path_;
    std::string query_;
};

}  // namespace hns_transfer

#endif  // HNS_TRANSFER_REMOTE_DESTINATION_URL_H
