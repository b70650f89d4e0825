/**
 * @file destination_url.cpp
 * @brief Implementation of destination URL parsing
 */

#include <hns_transfer/remote/destination_url.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace hns_transfer {

namespace {

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto malformed(std::string_view text, const std::string& reason) -> unexpected {
    return unexpected(error{error_code::malformed_destination,
                            "malformed destination '" + std::string(text) + "': " + reason});
}

}  // namespace

auto destination_url::parse(std::string_view text) -> result<destination_url> {
    if (text.empty()) {
        return malformed(text, "empty");
    }

    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || std::iscntrl(uc)) {
            return malformed(text, "contains whitespace or control characters");
        }
    }

    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return malformed(text, "missing scheme");
    }

    destination_url url;
    url.scheme_ = to_lower(text.substr(0, scheme_end));
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return malformed(text, "unsupported scheme '" + url.scheme_ + "'");
    }

    auto rest = text.substr(scheme_end + 3);

    // A fragment is never sent to the service
    auto fragment_pos = rest.find('#');
    if (fragment_pos != std::string_view::npos) {
        rest = rest.substr(0, fragment_pos);
    }

    auto query_pos = rest.find('?');
    if (query_pos != std::string_view::npos) {
        url.query_ = std::string(rest.substr(query_pos + 1));
        rest = rest.substr(0, query_pos);
    }

    auto path_pos = rest.find('/');
    auto authority = rest.substr(0, path_pos);
    auto path = path_pos == std::string_view::npos ? std::string_view{} : rest.substr(path_pos);

    // The port colon follows the closing bracket of an IPv6 literal
    size_t host_end = 0;
    if (!authority.empty() && authority.front() == '[') {
        auto bracket = authority.find(']');
        if (bracket == std::string_view::npos) {
            return malformed(text, "unterminated IPv6 host");
        }
        if (bracket == 1) {
            return malformed(text, "missing host");
        }
        host_end = bracket + 1;
        if (host_end < authority.size() && authority[host_end] != ':') {
            return malformed(text, "unexpected characters after IPv6 host");
        }
    }

    auto colon = authority.find(':', host_end);
    if (host_end == 0) {
        colon = authority.rfind(':');
    }
    if (colon != std::string_view::npos) {
        auto port_text = authority.substr(colon + 1);
        if (!port_text.empty()) {
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(port_text.data(),
                                             port_text.data() + port_text.size(), port);
            if (ec != std::errc{} || ptr != port_text.data() + port_text.size()) {
                return malformed(text, "invalid port");
            }
            url.port_ = port;
        }
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return malformed(text, "missing host");
    }
    url.host_ = to_lower(authority);

    std::vector<std::string_view> segments;
    while (!path.empty()) {
        auto slash = path.find('/');
        auto segment = path.substr(0, slash);
        if (!segment.empty()) {
            segments.push_back(segment);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        path = path.substr(slash + 1);
    }

    if (!segments.empty()) {
        url.filesystem_ = std::string(segments.front());
        for (size_t i = 1; i < segments.size(); ++i) {
            if (i > 1) {
                url.path_ += '/';
            }
            url.path_ += segments[i];
        }
    }

    return url;
}

auto destination_url::to_string() const -> std::string {
    std::string out = scheme_ + "://" + host_;
    if (port_) {
        out += ':' + std::to_string(*port_);
    }
    if (!filesystem_.empty()) {
        out += '/' + filesystem_;
        if (!path_.empty()) {
            out += '/' + path_;
        }
    }
    if (!query_.empty()) {
        out += '?' + query_;
    }
    return out;
}

}  // namespace hns_transfer
