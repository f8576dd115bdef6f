#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lmgate {

/**
 * @brief Base URL split for httplib::Client
 *
 * "http://127.0.0.1:8080/api/" → origin "http://127.0.0.1:8080",
 * path_prefix "/api". Requests are issued as path_prefix + path.
 */
struct BaseUrl {
    std::string scheme;         // "http" | "https"
    std::string host;
    uint16_t port = 0;
    std::string path_prefix;    // no trailing slash, may be empty

    [[nodiscard]] std::string origin() const;
    [[nodiscard]] std::string join(std::string_view path) const;
};

/**
 * @brief Parse an http:// or https:// base URL. nullopt when malformed.
 */
[[nodiscard]] std::optional<BaseUrl> parse_base_url(std::string_view url);

} // namespace lmgate
