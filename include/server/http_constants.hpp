#pragma once

#include <string>
#include <string_view>

namespace lmgate::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kRetryAfterHeader = "Retry-After";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kEventStreamContentType = "text/event-stream";

// nginx's "client closed request"; never seen by a client that left
inline constexpr int kClientClosedRequest = 499;

inline constexpr std::string_view kServiceName = "lmgate";
inline constexpr std::string_view kServiceVersion = "0.1.0";

} // namespace lmgate::http
