#include "core/url.hpp"
#include "core/utils.hpp"

#include <format>

namespace lmgate {

std::string BaseUrl::origin() const {
    return std::format("{}://{}:{}", scheme, host, port);
}

std::string BaseUrl::join(std::string_view path) const {
    std::string result = path_prefix;
    if (path.empty() || path.front() != '/') {
        result += '/';
    }
    result += path;
    return result;
}

std::optional<BaseUrl> parse_base_url(std::string_view url) {
    BaseUrl parsed;
    std::string_view rest;

    if (url.starts_with("https://")) {
        parsed.scheme = "https";
        parsed.port = 443;
        rest = url.substr(8);
    } else if (url.starts_with("http://")) {
        parsed.scheme = "http";
        parsed.port = 80;
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    std::string_view authority = rest;
    const auto path_pos = rest.find('/');
    if (path_pos != std::string_view::npos) {
        authority = rest.substr(0, path_pos);
        std::string_view path = rest.substr(path_pos);
        while (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        parsed.path_prefix = std::string(path);
    }

    // Explicit port
    const auto bracket = authority.rfind(']');     // IPv6 literal
    const auto port_pos = authority.rfind(':');
    if (port_pos != std::string_view::npos &&
        (bracket == std::string_view::npos || port_pos > bracket)) {
        const auto port = utils::parse_int<uint16_t>(authority.substr(port_pos + 1));
        if (!port || *port == 0) return std::nullopt;
        parsed.port = *port;
        authority = authority.substr(0, port_pos);
    }

    if (authority.empty()) return std::nullopt;
    parsed.host = std::string(authority);
    return parsed;
}

} // namespace lmgate
